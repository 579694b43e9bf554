#include "infrastructure/system/DnsService.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace nettune::infra {

namespace {

// Text describing why a command failed
std::string failureText(const core::CommandOutput& output, const CommandLine& command) {
    if (!output.started) {
        std::string text = "could not start '" + command.program + "'";
        if (!output.standardError.empty()) {
            text += ": " + output.standardError;
        }
        return text;
    }
    return output.standardError;
}

} // namespace

DnsService::DnsService(std::shared_ptr<core::ICommandRunner> runner,
                       std::unique_ptr<DnsCommandSet> commands)
    : runner_(std::move(runner)), commands_(std::move(commands)) {
    if (!runner_ || !commands_) {
        throw std::invalid_argument("DnsService needs a command runner and a command set");
    }
}

core::CommandOutput DnsService::run(const CommandLine& command) {
    spdlog::debug("Running: {}", command.toString());
    auto output = runner_->run(command.program, command.arguments);
    if (!output.started) {
        spdlog::error("Failed to start '{}': {}", command.program, output.standardError);
    } else if (output.exitCode != 0) {
        spdlog::warn("'{}' exited with status {}", command.toString(), output.exitCode);
    }
    return output;
}

std::optional<std::string> DnsService::activeAdapter() {
    auto output = run(commands_->listAdaptersCommand());
    if (!output.started) {
        return std::nullopt;
    }

    auto adapter = commands_->parseActiveAdapter(output.standardOutput);
    if (adapter) {
        spdlog::debug("Active adapter: {}", *adapter);
    } else {
        spdlog::info("No connected adapter found");
    }
    return adapter;
}

std::vector<std::string> DnsService::currentDns(const std::string& adapter) {
    auto output = run(commands_->showDnsCommand(adapter));
    if (!output.started) {
        return {};
    }
    return scrapeIpv4Addresses(output.standardOutput);
}

core::OperationResult DnsService::setDns(const std::string& adapter, const std::string& primary,
                                         const std::string& secondary) {
    for (const auto& step : commands_->setDnsCommands(adapter, primary, secondary)) {
        auto output = run(step.command);
        if (!output.succeeded()) {
            return core::OperationResult::error("Error setting " + step.roleLabel + " DNS " +
                                                step.server + ": " +
                                                failureText(output, step.command));
        }
    }

    spdlog::info("DNS for '{}' set to {}, {}", adapter, primary, secondary);
    return core::OperationResult::success("DNS servers " + primary + " and " + secondary +
                                          " set successfully for '" + adapter + "'");
}

core::OperationResult DnsService::clearDns(const std::string& adapter) {
    auto command = commands_->clearDnsCommand(adapter);
    auto output = run(command);
    if (!output.succeeded()) {
        return core::OperationResult::error("Error resetting DNS for '" + adapter +
                                            "': " + failureText(output, command));
    }

    spdlog::info("DNS for '{}' reset to DHCP", adapter);
    return core::OperationResult::success("DNS reset to DHCP successfully for '" + adapter +
                                          "'");
}

} // namespace nettune::infra
