/**
 * @file ICommandRunner.hpp
 * @brief Interface for running external commands.
 */

#pragma once

#include <string>
#include <vector>

namespace nettune::core {

/**
 * @brief Captured outcome of an external command.
 */
struct CommandOutput {
    bool started{false};        ///< False if the program could not be launched
    int exitCode{-1};           ///< Process exit status
    std::string standardOutput; ///< Captured stdout
    std::string standardError;  ///< Captured stderr, or the launch error

    [[nodiscard]] bool succeeded() const { return started && exitCode == 0; }
};

/**
 * @brief Runs a program to completion and captures its output.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Runs a program with arguments, without a shell.
     * @param program Executable name or path.
     * @param arguments Argument list.
     */
    virtual CommandOutput run(const std::string& program,
                              const std::vector<std::string>& arguments) = 0;
};

} // namespace nettune::core
