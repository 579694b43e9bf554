#include "app/Application.hpp"

#include "infrastructure/network/IcmpProbe.hpp"
#include "infrastructure/system/DnsCommandSet.hpp"
#include "infrastructure/system/DnsService.hpp"
#include "infrastructure/system/ProcessRunner.hpp"
#include "ui/windows/MainWindow.hpp"
#include "ui/windows/PingMonitorWindow.hpp"

#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace nettune::app {

Application* Application::instance_ = nullptr;

Application::Application(int& argc, char** argv) {
    instance_ = this;

    qtApp_ = std::make_unique<QApplication>(argc, argv);
    qtApp_->setApplicationName("NetTune");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("NetTune");

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (pingMonitorViewModel_) {
        pingMonitorViewModel_->closeSession();
    }

    // Joins the DNS worker before the config goes away
    dnsViewModel_.reset();
    pingMonitorViewModel_.reset();

    instance_ = nullptr;
}

void Application::initializeLogging() {
    auto configDir =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString();
    std::filesystem::create_directories(configDir);

    auto logPath = std::filesystem::path(configDir) / "nettune.log";

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("nettune", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("NetTune {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    auto configDir =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString();
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    const auto& cfg = config_->config();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    // DNS tool
    auto dnsService = std::make_shared<infra::DnsService>(
        std::make_shared<infra::ProcessRunner>(), infra::DnsCommandSet::forCurrentPlatform());
    spdlog::info("Using {} DNS backend", dnsService->commands().name());
    dnsViewModel_ = std::make_unique<viewmodels::DnsViewModel>(dnsService);

    // Ping monitor
    pingMonitorViewModel_ = std::make_unique<viewmodels::PingMonitorViewModel>(
        []() { return std::make_unique<infra::IcmpProbe>(); }, cfg.probeSettings(),
        static_cast<size_t>(cfg.historyCapacity), static_cast<size_t>(cfg.recentCapacity),
        cfg.thresholds);

    spdlog::info("Application components initialized");
}

int Application::run() {
    const auto& cfg = config_->config();

    ui::MainWindow mainWindow;
    mainWindow.setGeometry(cfg.windowX, cfg.windowY, cfg.windowWidth, cfg.windowHeight);

    // Closing the monitor alone must not end the application
    ui::PingMonitorWindow monitorWindow;
    monitorWindow.setAttribute(Qt::WA_QuitOnClose, false);
    monitorWindow.resize(cfg.windowWidth, cfg.windowHeight);

    QObject::connect(&mainWindow, &ui::MainWindow::pingMonitorRequested, &monitorWindow,
                     [&monitorWindow]() {
                         monitorWindow.show();
                         monitorWindow.raise();
                         monitorWindow.activateWindow();
                     });

    mainWindow.show();
    dnsViewModel_->refreshStatus();

    int rc = qtApp_->exec();
    monitorWindow.close();
    return rc;
}

Application& Application::instance() {
    return *instance_;
}

} // namespace nettune::app
