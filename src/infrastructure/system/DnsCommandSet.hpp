/**
 * @file DnsCommandSet.hpp
 * @brief Platform command lines for reading and writing DNS settings.
 *
 * A command set knows which system commands query and change the DNS
 * configuration of an adapter, and how to scrape the adapter name out of the
 * command's text output. It does not run anything itself.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nettune::infra {

/**
 * @brief A program and its argument list.
 */
struct CommandLine {
    std::string program;
    std::vector<std::string> arguments;

    /**
     * @brief Space-joined form for log messages.
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const CommandLine& other) const = default;
};

/**
 * @brief One command of a multi-step "set DNS" operation.
 */
struct DnsSetStep {
    CommandLine command;
    std::string server;    ///< Server this step applies
    std::string roleLabel; ///< "primary" or "secondary", used in error messages
};

/**
 * @brief Builds DNS commands and parses their output for one platform.
 */
class DnsCommandSet {
public:
    virtual ~DnsCommandSet() = default;

    /**
     * @brief Short backend name ("netsh", "resolvectl").
     */
    virtual std::string name() const = 0;

    virtual CommandLine listAdaptersCommand() const = 0;

    /**
     * @brief Extracts the active adapter from listAdaptersCommand() output.
     */
    virtual std::optional<std::string> parseActiveAdapter(const std::string& output) const = 0;

    virtual CommandLine showDnsCommand(const std::string& adapter) const = 0;

    /**
     * @brief Commands applying the servers, executed in order; the first failure aborts.
     */
    virtual std::vector<DnsSetStep> setDnsCommands(const std::string& adapter,
                                                   const std::string& primary,
                                                   const std::string& secondary) const = 0;

    virtual CommandLine clearDnsCommand(const std::string& adapter) const = 0;

    /**
     * @brief Command set for the platform the binary was built for.
     */
    static std::unique_ptr<DnsCommandSet> forCurrentPlatform();
};

/**
 * @brief Windows backend driving `netsh`.
 */
class NetshCommandSet : public DnsCommandSet {
public:
    std::string name() const override { return "netsh"; }
    CommandLine listAdaptersCommand() const override;
    std::optional<std::string> parseActiveAdapter(const std::string& output) const override;
    CommandLine showDnsCommand(const std::string& adapter) const override;
    std::vector<DnsSetStep> setDnsCommands(const std::string& adapter, const std::string& primary,
                                           const std::string& secondary) const override;
    CommandLine clearDnsCommand(const std::string& adapter) const override;
};

/**
 * @brief Linux backend driving `ip` and systemd-resolved's `resolvectl`.
 */
class ResolvectlCommandSet : public DnsCommandSet {
public:
    std::string name() const override { return "resolvectl"; }
    CommandLine listAdaptersCommand() const override;
    std::optional<std::string> parseActiveAdapter(const std::string& output) const override;
    CommandLine showDnsCommand(const std::string& adapter) const override;
    std::vector<DnsSetStep> setDnsCommands(const std::string& adapter, const std::string& primary,
                                           const std::string& secondary) const override;
    CommandLine clearDnsCommand(const std::string& adapter) const override;
};

/**
 * @brief Extracts every IPv4 dotted quad from free text, in order of appearance.
 */
std::vector<std::string> scrapeIpv4Addresses(const std::string& text);

} // namespace nettune::infra
