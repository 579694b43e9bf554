#pragma once

#include "core/services/ICommandRunner.hpp"

#include <chrono>

namespace nettune::infra {

/**
 * @brief Runs commands with QProcess, blocking until they finish.
 *
 * No shell is involved and, on Windows, no console window is shown. A command
 * that does not finish within the timeout is killed and reported as failed.
 * Safe to use from any thread; each call owns its own QProcess.
 */
class ProcessRunner : public core::ICommandRunner {
public:
    explicit ProcessRunner(std::chrono::milliseconds timeout = std::chrono::seconds(15));

    core::CommandOutput run(const std::string& program,
                            const std::vector<std::string>& arguments) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace nettune::infra
