#include "infrastructure/system/DnsCommandSet.hpp"

#include <regex>
#include <sstream>

namespace nettune::infra {

namespace {

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace

std::string CommandLine::toString() const {
    std::string text = program;
    for (const auto& argument : arguments) {
        text += ' ';
        text += argument;
    }
    return text;
}

std::unique_ptr<DnsCommandSet> DnsCommandSet::forCurrentPlatform() {
#ifdef _WIN32
    return std::make_unique<NetshCommandSet>();
#else
    return std::make_unique<ResolvectlCommandSet>();
#endif
}

std::vector<std::string> scrapeIpv4Addresses(const std::string& text) {
    static const std::regex pattern(R"(\b\d{1,3}(?:\.\d{1,3}){3}\b)");

    std::vector<std::string> addresses;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        addresses.push_back(it->str());
    }
    return addresses;
}

// netsh

CommandLine NetshCommandSet::listAdaptersCommand() const {
    return {"netsh", {"interface", "show", "interface"}};
}

std::optional<std::string> NetshCommandSet::parseActiveAdapter(const std::string& output) const {
    // Admin State | State | Type | Interface Name
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find("Connected") == std::string::npos ||
            line.find("Dedicated") == std::string::npos) {
            continue;
        }
        auto tokens = splitWhitespace(line);
        if (tokens.empty()) {
            return std::nullopt;
        }
        return tokens.back();
    }
    return std::nullopt;
}

CommandLine NetshCommandSet::showDnsCommand(const std::string& adapter) const {
    return {"netsh", {"interface", "ip", "show", "dns", "name=" + adapter}};
}

std::vector<DnsSetStep> NetshCommandSet::setDnsCommands(const std::string& adapter,
                                                        const std::string& primary,
                                                        const std::string& secondary) const {
    return {
        {{"netsh", {"interface", "ipv4", "set", "dns", "name=" + adapter, "static", primary}},
         primary,
         "primary"},
        {{"netsh", {"interface", "ipv4", "add", "dns", "name=" + adapter, secondary, "index=2"}},
         secondary,
         "secondary"},
    };
}

CommandLine NetshCommandSet::clearDnsCommand(const std::string& adapter) const {
    return {"netsh", {"interface", "ipv4", "set", "dns", "name=" + adapter, "source=dhcp"}};
}

// resolvectl

CommandLine ResolvectlCommandSet::listAdaptersCommand() const {
    return {"ip", {"route", "show", "default"}};
}

std::optional<std::string>
ResolvectlCommandSet::parseActiveAdapter(const std::string& output) const {
    // default via 192.168.1.1 dev wlan0 proto dhcp metric 600
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto tokens = splitWhitespace(line);
        if (tokens.empty() || tokens.front() != "default") {
            continue;
        }
        for (size_t i = 1; i + 1 < tokens.size(); ++i) {
            if (tokens[i] == "dev") {
                return tokens[i + 1];
            }
        }
    }
    return std::nullopt;
}

CommandLine ResolvectlCommandSet::showDnsCommand(const std::string& adapter) const {
    return {"resolvectl", {"dns", adapter}};
}

std::vector<DnsSetStep> ResolvectlCommandSet::setDnsCommands(const std::string& adapter,
                                                             const std::string& primary,
                                                             const std::string& secondary) const {
    // resolvectl replaces the whole server list in one call
    return {{{"resolvectl", {"dns", adapter, primary, secondary}}, primary, "primary"}};
}

CommandLine ResolvectlCommandSet::clearDnsCommand(const std::string& adapter) const {
    return {"resolvectl", {"revert", adapter}};
}

} // namespace nettune::infra
