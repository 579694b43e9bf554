/**
 * @file DnsViewModel.hpp
 * @brief ViewModel for the DNS preset tool.
 *
 * Runs DNS operations on a background worker so the UI thread never waits on
 * a system command. Results come back over channels that the view drains by
 * calling poll() on every UI tick.
 */

#pragma once

#include "core/concurrency/Channel.hpp"
#include "core/services/IDnsService.hpp"
#include "core/types/DnsTypes.hpp"
#include "infrastructure/concurrency/WorkerThread.hpp"

#include <QObject>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nettune::viewmodels {

/**
 * @brief Adapter and DNS servers as last read from the system.
 */
struct DnsStatus {
    std::optional<std::string> adapter;
    std::vector<std::string> servers;
};

/**
 * @brief ViewModel for selecting, applying and clearing DNS presets.
 *
 * Only one operation runs at a time; requests made while one is processing
 * are rejected. After a successful operation the DNS status is re-read.
 */
class DnsViewModel : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs the ViewModel and starts its worker thread.
     * @param dnsService Service used for all system access.
     * @param parent Optional parent QObject for Qt ownership.
     * @throws std::invalid_argument if dnsService is null.
     */
    explicit DnsViewModel(std::shared_ptr<core::IDnsService> dnsService,
                          QObject* parent = nullptr);

    /**
     * @brief Destructor. Waits for a running command to finish.
     */
    ~DnsViewModel() override;

    /**
     * @brief Queues an operation on the worker thread.
     *
     * A Set with a Custom provider whose fields are not both valid addresses
     * fails immediately without running any command.
     * @return True if the operation was queued.
     */
    bool requestOperation(const core::DnsOperation& operation);

    /**
     * @brief Re-reads the adapter and DNS servers in the background.
     */
    void refreshStatus();

    /**
     * @brief Consumes finished operations and status updates without blocking.
     * @return True if anything changed.
     */
    bool poll();

    bool isProcessing() const { return state_.kind == core::AppState::Kind::Processing; }

    const core::AppState& state() const { return state_; }
    const DnsStatus& status() const { return status_; }
    core::DnsState dnsState() const { return core::DnsState::fromServers(status_.servers); }

    core::DnsProviderKind selectedProvider() const { return selected_; }
    void setSelectedProvider(core::DnsProviderKind kind);

    /**
     * @brief The selected preset; for Custom, built from the input fields.
     */
    core::DnsProvider provider() const;

    const std::string& customPrimary() const { return customPrimary_; }
    const std::string& customSecondary() const { return customSecondary_; }
    void setCustomServers(const std::string& primary, const std::string& secondary);

signals:
    void stateChanged();
    void statusChanged();
    void selectionChanged();

private:
    void setState(core::AppState state);

    std::shared_ptr<core::IDnsService> dnsService_;
    std::shared_ptr<core::Channel<core::OperationResult>> results_;
    std::shared_ptr<core::Channel<DnsStatus>> statusUpdates_;
    infra::WorkerThread worker_;

    core::AppState state_;
    DnsStatus status_;
    core::DnsProviderKind selected_{core::DnsProviderKind::Electro};
    std::string customPrimary_;
    std::string customSecondary_;
};

} // namespace nettune::viewmodels
