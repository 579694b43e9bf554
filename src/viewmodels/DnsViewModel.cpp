#include "viewmodels/DnsViewModel.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace nettune::viewmodels {

namespace {

std::string joinServers(const std::vector<std::string>& servers) {
    std::string text;
    for (const auto& server : servers) {
        if (!text.empty()) {
            text += ", ";
        }
        text += server;
    }
    return text;
}

core::OperationResult runOperation(core::IDnsService& service,
                                   const core::DnsOperation& operation) {
    auto adapter = service.activeAdapter();
    if (!adapter) {
        return core::OperationResult::error("No Internet Connection Found");
    }

    switch (operation.type) {
    case core::DnsOperation::Type::Set: {
        auto [primary, secondary] = operation.provider.servers();
        return service.setDns(*adapter, primary, secondary);
    }
    case core::DnsOperation::Type::Clear:
        return service.clearDns(*adapter);
    case core::DnsOperation::Type::Test: {
        auto servers = service.currentDns(*adapter);
        if (servers.empty()) {
            return core::OperationResult::warning("No DNS servers configured");
        }
        return core::OperationResult::success("DNS test successful: " + joinServers(servers));
    }
    }
    return core::OperationResult::error("Unknown DNS operation");
}

DnsStatus readStatus(core::IDnsService& service) {
    DnsStatus status;
    status.adapter = service.activeAdapter();
    if (status.adapter) {
        status.servers = service.currentDns(*status.adapter);
    }
    return status;
}

} // namespace

DnsViewModel::DnsViewModel(std::shared_ptr<core::IDnsService> dnsService, QObject* parent)
    : QObject(parent),
      dnsService_(std::move(dnsService)),
      results_(std::make_shared<core::Channel<core::OperationResult>>()),
      statusUpdates_(std::make_shared<core::Channel<DnsStatus>>()),
      worker_("dns") {
    if (!dnsService_) {
        throw std::invalid_argument("DnsViewModel needs a DNS service");
    }
    worker_.start();
}

DnsViewModel::~DnsViewModel() {
    results_->close();
    statusUpdates_->close();
    worker_.stop();
}

bool DnsViewModel::requestOperation(const core::DnsOperation& operation) {
    if (isProcessing()) {
        spdlog::warn("DNS operation rejected, another one is still running");
        return false;
    }

    if (operation.type == core::DnsOperation::Type::Set && operation.provider.isCustom() &&
        !operation.provider.hasValidServers()) {
        setState(core::AppState::fromResult(
            core::OperationResult::error("Invalid custom DNS servers")));
        return false;
    }

    setState(core::AppState::processing());

    worker_.post([service = dnsService_, results = results_, operation]() {
        core::OperationResult result;
        try {
            result = runOperation(*service, operation);
        } catch (const std::exception& e) {
            spdlog::error("DNS operation failed: {}", e.what());
            result = core::OperationResult::error(e.what());
        }
        results->send(std::move(result));
    });
    return true;
}

void DnsViewModel::refreshStatus() {
    worker_.post([service = dnsService_, updates = statusUpdates_]() {
        try {
            updates->send(readStatus(*service));
        } catch (const std::exception& e) {
            spdlog::error("Failed to read DNS status: {}", e.what());
        }
    });
}

bool DnsViewModel::poll() {
    bool changed = false;

    while (auto result = results_->tryReceive()) {
        if (result->isError()) {
            spdlog::warn("{}", result->message);
        } else {
            spdlog::info("{}", result->message);
        }
        setState(core::AppState::fromResult(*result));
        if (result->isSuccess()) {
            refreshStatus();
        }
        changed = true;
    }

    while (auto status = statusUpdates_->tryReceive()) {
        status_ = std::move(*status);
        emit statusChanged();
        changed = true;
    }

    return changed;
}

void DnsViewModel::setSelectedProvider(core::DnsProviderKind kind) {
    if (selected_ == kind) {
        return;
    }
    selected_ = kind;
    emit selectionChanged();
}

core::DnsProvider DnsViewModel::provider() const {
    if (selected_ == core::DnsProviderKind::Custom) {
        return core::DnsProvider::custom(customPrimary_, customSecondary_);
    }
    return core::DnsProvider::fromKind(selected_);
}

void DnsViewModel::setCustomServers(const std::string& primary, const std::string& secondary) {
    customPrimary_ = primary;
    customSecondary_ = secondary;
    emit selectionChanged();
}

void DnsViewModel::setState(core::AppState state) {
    state_ = std::move(state);
    emit stateChanged();
}

} // namespace nettune::viewmodels
