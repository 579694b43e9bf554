#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/DnsTypes.hpp"
#include "core/types/Ipv4Address.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace nettune::infra {

ProbeSettings AppConfig::probeSettings() const {
    ProbeSettings settings;
    settings.target = probeTarget;
    settings.timeout = std::chrono::milliseconds(probeTimeoutMs);
    settings.interval = std::chrono::milliseconds(probeIntervalMs);
    return settings;
}

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;

        // Nothing is applied unless the whole file parses
        auto loaded = fromJson(j);
        validate(loaded);
        config_ = std::move(loaded);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // General
    j["general"]["theme"] = config_.theme;
    j["general"]["log_level"] = config_.logLevel;

    // Probe
    j["probe"]["target"] = config_.probeTarget;
    j["probe"]["timeout_ms"] = config_.probeTimeoutMs;
    j["probe"]["interval_ms"] = config_.probeIntervalMs;

    // Ping monitor
    j["monitor"]["history_capacity"] = config_.historyCapacity;
    j["monitor"]["recent_capacity"] = config_.recentCapacity;

    // Latency bands
    j["thresholds"]["warning_ms"] = config_.thresholds.warningMs;
    j["thresholds"]["bad_ms"] = config_.thresholds.badMs;

    // DNS
    j["dns"]["last_provider"] = config_.lastProvider;
    j["dns"]["custom_primary"] = config_.customPrimary;
    j["dns"]["custom_secondary"] = config_.customSecondary;

    // Window state
    j["window"]["x"] = config_.windowX;
    j["window"]["y"] = config_.windowY;
    j["window"]["width"] = config_.windowWidth;
    j["window"]["height"] = config_.windowHeight;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;
    AppConfig config;

    // General
    if (j.contains("general")) {
        const auto& g = j["general"];
        config.theme = g.value("theme", defaults.theme);
        config.logLevel = g.value("log_level", defaults.logLevel);
    }

    // Probe
    if (j.contains("probe")) {
        const auto& p = j["probe"];
        config.probeTarget = p.value("target", defaults.probeTarget);
        config.probeTimeoutMs = p.value("timeout_ms", defaults.probeTimeoutMs);
        config.probeIntervalMs = p.value("interval_ms", defaults.probeIntervalMs);
    }

    // Ping monitor
    if (j.contains("monitor")) {
        const auto& m = j["monitor"];
        config.historyCapacity = m.value("history_capacity", defaults.historyCapacity);
        config.recentCapacity = m.value("recent_capacity", defaults.recentCapacity);
    }

    // Latency bands
    if (j.contains("thresholds")) {
        const auto& t = j["thresholds"];
        config.thresholds.warningMs = t.value("warning_ms", defaults.thresholds.warningMs);
        config.thresholds.badMs = t.value("bad_ms", defaults.thresholds.badMs);
    }

    // DNS
    if (j.contains("dns")) {
        const auto& d = j["dns"];
        config.lastProvider = d.value("last_provider", defaults.lastProvider);
        config.customPrimary = d.value("custom_primary", defaults.customPrimary);
        config.customSecondary = d.value("custom_secondary", defaults.customSecondary);
    }

    // Window state
    if (j.contains("window")) {
        const auto& w = j["window"];
        config.windowX = w.value("x", defaults.windowX);
        config.windowY = w.value("y", defaults.windowY);
        config.windowWidth = w.value("width", defaults.windowWidth);
        config.windowHeight = w.value("height", defaults.windowHeight);
    }

    return config;
}

void ConfigManager::validate(AppConfig& config) {
    const AppConfig defaults;

    if (spdlog::level::from_str(config.logLevel) == spdlog::level::off &&
        config.logLevel != "off") {
        spdlog::warn("Unknown log level '{}', using '{}'", config.logLevel, defaults.logLevel);
        config.logLevel = defaults.logLevel;
    }

    if (!core::isValidIpv4(config.probeTarget)) {
        spdlog::warn("Invalid probe target '{}', using {}", config.probeTarget,
                     defaults.probeTarget);
        config.probeTarget = defaults.probeTarget;
    }
    if (config.probeTimeoutMs <= 0) {
        spdlog::warn("Invalid probe timeout {}ms, using {}ms", config.probeTimeoutMs,
                     defaults.probeTimeoutMs);
        config.probeTimeoutMs = defaults.probeTimeoutMs;
    }
    if (config.probeIntervalMs <= 0) {
        spdlog::warn("Invalid probe interval {}ms, using {}ms", config.probeIntervalMs,
                     defaults.probeIntervalMs);
        config.probeIntervalMs = defaults.probeIntervalMs;
    }

    if (config.historyCapacity <= 0) {
        spdlog::warn("Invalid history capacity {}, using {}", config.historyCapacity,
                     defaults.historyCapacity);
        config.historyCapacity = defaults.historyCapacity;
    }
    if (config.recentCapacity <= 0) {
        spdlog::warn("Invalid recent capacity {}, using {}", config.recentCapacity,
                     defaults.recentCapacity);
        config.recentCapacity = defaults.recentCapacity;
    }

    if (!config.thresholds.isValid()) {
        spdlog::warn("Invalid latency thresholds {}/{}ms, using {}/{}ms",
                     config.thresholds.warningMs, config.thresholds.badMs,
                     defaults.thresholds.warningMs, defaults.thresholds.badMs);
        config.thresholds = defaults.thresholds;
    }

    if (!core::providerKindFromString(config.lastProvider)) {
        spdlog::warn("Unknown DNS provider '{}', using {}", config.lastProvider,
                     defaults.lastProvider);
        config.lastProvider = defaults.lastProvider;
    }

    if (config.windowWidth <= 0 || config.windowHeight <= 0) {
        config.windowWidth = defaults.windowWidth;
        config.windowHeight = defaults.windowHeight;
    }
}

} // namespace nettune::infra
