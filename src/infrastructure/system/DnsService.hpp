#pragma once

#include "core/services/ICommandRunner.hpp"
#include "core/services/IDnsService.hpp"
#include "infrastructure/system/DnsCommandSet.hpp"

#include <memory>

namespace nettune::infra {

/**
 * @brief DNS service that shells out to the platform's network tools.
 *
 * Only the exit status of each command is interpreted; the text output is
 * scraped for the adapter name and server addresses and otherwise passed
 * through in error messages.
 */
class DnsService : public core::IDnsService {
public:
    /**
     * @throws std::invalid_argument if either collaborator is null.
     */
    DnsService(std::shared_ptr<core::ICommandRunner> runner,
               std::unique_ptr<DnsCommandSet> commands);

    std::optional<std::string> activeAdapter() override;
    std::vector<std::string> currentDns(const std::string& adapter) override;
    core::OperationResult setDns(const std::string& adapter, const std::string& primary,
                                 const std::string& secondary) override;
    core::OperationResult clearDns(const std::string& adapter) override;

    const DnsCommandSet& commands() const { return *commands_; }

private:
    core::CommandOutput run(const CommandLine& command);

    std::shared_ptr<core::ICommandRunner> runner_;
    std::unique_ptr<DnsCommandSet> commands_;
};

} // namespace nettune::infra
