#pragma once

#include "infrastructure/config/ConfigManager.hpp"
#include "viewmodels/DnsViewModel.hpp"
#include "viewmodels/PingMonitorViewModel.hpp"

#include <QApplication>
#include <memory>

namespace nettune::app {

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }

    viewmodels::DnsViewModel& dnsViewModel() { return *dnsViewModel_; }
    viewmodels::PingMonitorViewModel& pingMonitorViewModel() { return *pingMonitorViewModel_; }

    static Application& instance();

private:
    void initializeLogging();
    void initializeComponents();

    std::unique_ptr<QApplication> qtApp_;
    std::unique_ptr<infra::ConfigManager> config_;

    std::unique_ptr<viewmodels::DnsViewModel> dnsViewModel_;
    std::unique_ptr<viewmodels::PingMonitorViewModel> pingMonitorViewModel_;

    static Application* instance_;
};

} // namespace nettune::app
