/**
 * @file DnsTypes.hpp
 * @brief DNS presets, operations, results and configuration states.
 *
 * This file defines the value types shared by the DNS service, the DNS
 * view model and the main window.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nettune::core {

/**
 * @brief Named DNS preset.
 */
enum class DnsProviderKind : int {
    Electro = 0,
    Radar = 1,
    Shekan = 2,
    Bogzar = 3,
    Quad9 = 4,
    Custom = 5 ///< Servers come from the user's input fields
};

/**
 * @brief A DNS preset and its primary/secondary server pair.
 */
struct DnsProvider {
    DnsProviderKind kind{DnsProviderKind::Electro};
    std::string primary{"78.157.42.100"};
    std::string secondary{"78.157.42.101"};

    static DnsProvider electro();
    static DnsProvider radar();
    static DnsProvider shekan();
    static DnsProvider bogzar();
    static DnsProvider quad9();

    /**
     * @brief Creates a Custom preset from user-supplied addresses.
     */
    static DnsProvider custom(std::string primary, std::string secondary);

    /**
     * @brief Returns the preset for a kind. Custom starts with empty fields.
     */
    static DnsProvider fromKind(DnsProviderKind kind);

    /**
     * @brief Primary and secondary server addresses.
     */
    [[nodiscard]] std::pair<std::string, std::string> servers() const {
        return {primary, secondary};
    }

    /**
     * @brief Display name for the UI ("Electro", "Custom"...).
     */
    [[nodiscard]] std::string displayName() const;

    /**
     * @brief True when both servers are valid, non-empty IPv4 addresses.
     */
    [[nodiscard]] bool hasValidServers() const;

    [[nodiscard]] bool isCustom() const { return kind == DnsProviderKind::Custom; }

    bool operator==(const DnsProvider& other) const = default;
};

/**
 * @brief All presets in display order, Custom last with empty fields.
 */
std::vector<DnsProvider> builtinProviders();

std::string providerKindToString(DnsProviderKind kind);
std::optional<DnsProviderKind> providerKindFromString(const std::string& name);

/**
 * @brief Operation requested by the user.
 */
struct DnsOperation {
    enum class Type : int {
        Set = 0,   ///< Apply the provider's servers
        Clear = 1, ///< Reset DNS to DHCP
        Test = 2   ///< Read back the configured servers
    };

    Type type{Type::Test};
    DnsProvider provider; ///< Used by Set only

    static DnsOperation set(DnsProvider provider) { return {Type::Set, std::move(provider)}; }
    static DnsOperation clear() { return {Type::Clear, {}}; }
    static DnsOperation test() { return {Type::Test, {}}; }

    bool operator==(const DnsOperation& other) const = default;
};

/**
 * @brief Outcome of a DNS operation, carrying a user-visible message.
 */
struct OperationResult {
    enum class Kind : int { Success = 0, Warning = 1, Error = 2 };

    Kind kind{Kind::Success};
    std::string message;

    static OperationResult success(std::string message) { return {Kind::Success, std::move(message)}; }
    static OperationResult warning(std::string message) { return {Kind::Warning, std::move(message)}; }
    static OperationResult error(std::string message) { return {Kind::Error, std::move(message)}; }

    [[nodiscard]] bool isSuccess() const { return kind == Kind::Success; }
    [[nodiscard]] bool isError() const { return kind == Kind::Error; }

    bool operator==(const OperationResult& other) const = default;
};

/**
 * @brief State of the DNS tool as shown in the status card.
 */
struct AppState {
    enum class Kind : int { Idle = 0, Processing = 1, Success = 2, Warning = 3, Error = 4 };

    Kind kind{Kind::Idle};
    std::string message;

    static AppState idle() { return {}; }
    static AppState processing() { return {Kind::Processing, {}}; }

    /**
     * @brief Maps a finished operation onto Success, Warning or Error.
     */
    static AppState fromResult(const OperationResult& result);

    bool operator==(const AppState& other) const = default;
};

/**
 * @brief How the adapter's DNS servers are currently configured.
 */
struct DnsState {
    enum class Kind : int {
        None = 0,   ///< No servers reported
        Dhcp = 1,   ///< Servers assigned automatically
        Static = 2  ///< Servers set explicitly
    };

    Kind kind{Kind::None};
    std::vector<std::string> servers; ///< Filled for Static only

    /**
     * @brief Derives the state from a server list.
     *
     * Empty list is None; a single entry mentioning "dhcp" is Dhcp;
     * anything else is Static.
     */
    static DnsState fromServers(const std::vector<std::string>& servers);

    [[nodiscard]] std::string toString() const;

    bool operator==(const DnsState& other) const = default;
};

} // namespace nettune::core
