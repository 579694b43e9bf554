#include <catch2/catch_test_macros.hpp>

#include "core/monitor/LatencyTracker.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace nettune::infra;
using namespace nettune::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "nettune_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const nlohmann::json& j) const { writeRaw(j.dump(2)); }

    void writeRaw(const std::string& text) const {
        std::ofstream file(configDir_ / "config.json");
        file << text;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "nettune_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::exists(tempPath));
        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets correct paths") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.configDir() == testDir.path().string());
    }
}

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("load writes defaults when the file does not exist") {
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(std::filesystem::exists(manager.configPath()));
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.theme == "dark");
        REQUIRE(config.logLevel == "info");
        REQUIRE(config.probeTarget == "8.8.8.8");
        REQUIRE(config.probeTimeoutMs == 1000);
        REQUIRE(config.probeIntervalMs == 1000);
        REQUIRE(config.historyCapacity == 15);
        REQUIRE(config.recentCapacity == 5);
        REQUIRE(config.thresholds.warningMs == 100);
        REQUIRE(config.thresholds.badMs == 200);
        REQUIRE(config.lastProvider == "Electro");
        REQUIRE(config.customPrimary.empty());
        REQUIRE(config.customSecondary.empty());
    }

    SECTION("load reads an existing file") {
        nlohmann::json j;
        j["general"]["theme"] = "light";
        j["general"]["log_level"] = "debug";
        j["probe"]["target"] = "1.1.1.1";
        j["probe"]["interval_ms"] = 500;
        j["monitor"]["history_capacity"] = 30;
        j["thresholds"]["warning_ms"] = 50;
        j["thresholds"]["bad_ms"] = 150;
        j["dns"]["last_provider"] = "Quad9";
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.theme == "light");
        REQUIRE(config.logLevel == "debug");
        REQUIRE(config.probeTarget == "1.1.1.1");
        REQUIRE(config.probeIntervalMs == 500);
        REQUIRE(config.probeTimeoutMs == 1000);
        REQUIRE(config.historyCapacity == 30);
        REQUIRE(config.recentCapacity == 5);
        REQUIRE(config.thresholds == LatencyThresholds{50, 150});
        REQUIRE(config.lastProvider == "Quad9");
    }

    SECTION("load returns false for invalid JSON and keeps defaults") {
        testDir.writeRaw("{ invalid json content }}}");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().probeTarget == "8.8.8.8");
        REQUIRE(manager.config().historyCapacity == 15);
    }
}

TEST_CASE("ConfigManager wrong-typed values", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Fields read before the bad one are not applied") {
        nlohmann::json j;
        j["probe"]["timeout_ms"] = -5;
        j["thresholds"]["warning_ms"] = 300;
        j["thresholds"]["bad_ms"] = 200;
        j["dns"]["last_provider"] = 5;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.probeTimeoutMs == 1000);
        REQUIRE(config.thresholds == LatencyThresholds{});
        REQUIRE(config.thresholds.isValid());
        REQUIRE(config.lastProvider == "Electro");

        // The ping monitor can be built from what is left
        REQUIRE_NOTHROW(LatencyTracker(static_cast<size_t>(config.historyCapacity),
                                       config.thresholds));
        REQUIRE(config.probeSettings().timeout.count() > 0);
    }

    SECTION("A failed reload keeps the configuration already loaded") {
        nlohmann::json good;
        good["probe"]["target"] = "1.1.1.1";
        good["thresholds"]["warning_ms"] = 80;
        good["thresholds"]["bad_ms"] = 160;
        testDir.write(good);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        nlohmann::json bad;
        bad["probe"]["target"] = "9.9.9.9";
        bad["thresholds"]["warning_ms"] = "fast";
        testDir.write(bad);

        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().probeTarget == "1.1.1.1");
        REQUIRE(manager.config().thresholds == LatencyThresholds{80, 160});
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Out of range values fall back to defaults") {
        nlohmann::json j;
        j["general"]["log_level"] = "verbose";
        j["probe"]["target"] = "not-an-address";
        j["probe"]["timeout_ms"] = 0;
        j["probe"]["interval_ms"] = -5;
        j["monitor"]["history_capacity"] = 0;
        j["monitor"]["recent_capacity"] = -1;
        j["dns"]["last_provider"] = "Unknown DNS";
        j["window"]["width"] = 0;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.logLevel == "info");
        REQUIRE(config.probeTarget == "8.8.8.8");
        REQUIRE(config.probeTimeoutMs == 1000);
        REQUIRE(config.probeIntervalMs == 1000);
        REQUIRE(config.historyCapacity == 15);
        REQUIRE(config.recentCapacity == 5);
        REQUIRE(config.lastProvider == "Electro");
        REQUIRE(config.windowWidth == 250);
        REQUIRE(config.windowHeight == 520);
    }

    SECTION("Inverted thresholds are replaced as a pair") {
        nlohmann::json j;
        j["thresholds"]["warning_ms"] = 300;
        j["thresholds"]["bad_ms"] = 200;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().thresholds == LatencyThresholds{});
    }

    SECTION("The off log level is accepted") {
        nlohmann::json j;
        j["general"]["log_level"] = "off";
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().logLevel == "off");
    }

    SECTION("Custom is a valid last provider") {
        nlohmann::json j;
        j["dns"]["last_provider"] = "Custom";
        j["dns"]["custom_primary"] = "1.1.1.1";
        j["dns"]["custom_secondary"] = "1.0.0.1";
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().lastProvider == "Custom");
        REQUIRE(manager.config().customPrimary == "1.1.1.1");
        REQUIRE(manager.config().customSecondary == "1.0.0.1");
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("save creates config file") {
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(std::filesystem::exists(manager.configPath()));
        REQUIRE(manager.save());
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("save persists configuration changes") {
        ConfigManager manager(testDir.path());
        manager.config().theme = "light";
        manager.config().probeTarget = "9.9.9.9";
        manager.config().recentCapacity = 8;
        manager.config().lastProvider = "Radar";
        manager.config().windowX = 42;
        REQUIRE(manager.save());

        ConfigManager manager2(testDir.path());
        REQUIRE(manager2.load());

        REQUIRE(manager2.config().theme == "light");
        REQUIRE(manager2.config().probeTarget == "9.9.9.9");
        REQUIRE(manager2.config().recentCapacity == 8);
        REQUIRE(manager2.config().lastProvider == "Radar");
        REQUIRE(manager2.config().windowX == 42);
    }

    SECTION("Saved file uses the sectioned layout") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.save());

        std::ifstream file(manager.configPath());
        auto j = nlohmann::json::parse(file);

        REQUIRE(j["probe"]["target"] == "8.8.8.8");
        REQUIRE(j["monitor"]["history_capacity"] == 15);
        REQUIRE(j["thresholds"]["bad_ms"] == 200);
        REQUIRE(j["dns"]["last_provider"] == "Electro");
    }
}

TEST_CASE("AppConfig probe settings", "[ConfigManager]") {
    AppConfig config;
    config.probeTarget = "1.1.1.1";
    config.probeTimeoutMs = 750;
    config.probeIntervalMs = 2000;

    auto settings = config.probeSettings();
    REQUIRE(settings.target == "1.1.1.1");
    REQUIRE(settings.timeout == std::chrono::milliseconds(750));
    REQUIRE(settings.interval == std::chrono::milliseconds(2000));
}
