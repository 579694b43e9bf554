#pragma once

#include "core/types/LatencyBand.hpp"
#include "infrastructure/network/ProbeSettings.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace nettune::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the user-configurable settings of both the DNS tool and the ping
 * monitor, plus the persisted window geometry.
 */
struct AppConfig {
    // General settings
    std::string theme{"dark"};    ///< UI theme ("dark" or "light").
    std::string logLevel{"info"}; ///< spdlog level name.

    // Probe
    std::string probeTarget{"8.8.8.8"}; ///< Address the ping monitor probes.
    int probeTimeoutMs{1000};           ///< Per-probe reply timeout.
    int probeIntervalMs{1000};          ///< Pause between probes.

    // Ping monitor
    int historyCapacity{15}; ///< Samples shown in the chart.
    int recentCapacity{5};   ///< Samples shown in the recent list.

    core::LatencyThresholds thresholds; ///< Latency band boundaries.

    // DNS
    std::string lastProvider{"Electro"}; ///< Preset selected on last exit.
    std::string customPrimary;           ///< Custom preset, primary server.
    std::string customSecondary;         ///< Custom preset, secondary server.

    // Window state
    int windowX{100};
    int windowY{100};
    int windowWidth{250};
    int windowHeight{520};

    /**
     * @brief Probe settings derived from the probe section.
     */
    ProbeSettings probeSettings() const;
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration as a JSON file. Values that
 * are present but out of range are replaced by their defaults with a warning.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory, created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * Writes the defaults if no file exists yet. A file that cannot be read
     * completely leaves the current configuration untouched.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    static AppConfig fromJson(const nlohmann::json& j);
    static void validate(AppConfig& config);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace nettune::infra
