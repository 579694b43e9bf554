#include "core/types/DnsTypes.hpp"

#include "core/types/Ipv4Address.hpp"

#include <algorithm>
#include <cctype>

namespace nettune::core {

DnsProvider DnsProvider::electro() {
    return {DnsProviderKind::Electro, "78.157.42.100", "78.157.42.101"};
}

DnsProvider DnsProvider::radar() {
    return {DnsProviderKind::Radar, "10.202.10.10", "10.202.10.11"};
}

DnsProvider DnsProvider::shekan() {
    return {DnsProviderKind::Shekan, "178.22.122.100", "185.51.200.2"};
}

DnsProvider DnsProvider::bogzar() {
    return {DnsProviderKind::Bogzar, "185.55.226.26", "185.55.225.25"};
}

DnsProvider DnsProvider::quad9() {
    return {DnsProviderKind::Quad9, "9.9.9.9", "149.112.112.112"};
}

DnsProvider DnsProvider::custom(std::string primary, std::string secondary) {
    return {DnsProviderKind::Custom, std::move(primary), std::move(secondary)};
}

DnsProvider DnsProvider::fromKind(DnsProviderKind kind) {
    switch (kind) {
    case DnsProviderKind::Electro:
        return electro();
    case DnsProviderKind::Radar:
        return radar();
    case DnsProviderKind::Shekan:
        return shekan();
    case DnsProviderKind::Bogzar:
        return bogzar();
    case DnsProviderKind::Quad9:
        return quad9();
    case DnsProviderKind::Custom:
        return custom({}, {});
    }
    return electro();
}

std::string DnsProvider::displayName() const {
    return providerKindToString(kind);
}

bool DnsProvider::hasValidServers() const {
    return isValidIpv4(primary) && isValidIpv4(secondary);
}

std::vector<DnsProvider> builtinProviders() {
    return {DnsProvider::electro(), DnsProvider::radar(),  DnsProvider::shekan(),
            DnsProvider::bogzar(),  DnsProvider::quad9(),  DnsProvider::custom({}, {})};
}

std::string providerKindToString(DnsProviderKind kind) {
    switch (kind) {
    case DnsProviderKind::Electro:
        return "Electro";
    case DnsProviderKind::Radar:
        return "Radar";
    case DnsProviderKind::Shekan:
        return "Shekan";
    case DnsProviderKind::Bogzar:
        return "Bogzar";
    case DnsProviderKind::Quad9:
        return "Quad9";
    case DnsProviderKind::Custom:
        return "Custom";
    }
    return "Electro";
}

std::optional<DnsProviderKind> providerKindFromString(const std::string& name) {
    for (const auto& provider : builtinProviders()) {
        if (provider.displayName() == name) {
            return provider.kind;
        }
    }
    return std::nullopt;
}

AppState AppState::fromResult(const OperationResult& result) {
    switch (result.kind) {
    case OperationResult::Kind::Success:
        return {Kind::Success, result.message};
    case OperationResult::Kind::Warning:
        return {Kind::Warning, result.message};
    case OperationResult::Kind::Error:
        return {Kind::Error, result.message};
    }
    return {Kind::Error, result.message};
}

DnsState DnsState::fromServers(const std::vector<std::string>& servers) {
    if (servers.empty()) {
        return {Kind::None, {}};
    }

    if (servers.size() == 1) {
        std::string lowered = servers.front();
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered.find("dhcp") != std::string::npos) {
            return {Kind::Dhcp, {}};
        }
    }

    return {Kind::Static, servers};
}

std::string DnsState::toString() const {
    switch (kind) {
    case Kind::None:
        return "None";
    case Kind::Dhcp:
        return "DHCP";
    case Kind::Static: {
        std::string joined = "Static";
        for (size_t i = 0; i < servers.size(); ++i) {
            joined += (i == 0 ? ": " : ", ");
            joined += servers[i];
        }
        return joined;
    }
    }
    return "None";
}

} // namespace nettune::core
