#pragma once

#include "core/types/ProbeResult.hpp"
#include "ui/widgets/LatencyChartWidget.hpp"
#include "ui/widgets/StatusIndicator.hpp"

#include <QLabel>
#include <QListWidget>
#include <QTimer>
#include <QWidget>

namespace nettune::ui {

/**
 * @brief Live latency window.
 *
 * Opens a probe session when shown and closes it, clearing the history, when
 * the window is closed. A single-shot timer drives polling; its delay adapts
 * to whether samples are arriving.
 */
class PingMonitorWindow : public QWidget {
    Q_OBJECT

public:
    explicit PingMonitorWindow(QWidget* parent = nullptr);
    ~PingMonitorWindow() override;

protected:
    void showEvent(QShowEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onPollTick();
    void onSampleReceived(const nettune::core::ProbeResult& result);

private:
    void setupUi();
    void showWaiting();
    void refreshRecentList();
    void scheduleNextPoll();

    QLabel* targetLabel_{nullptr};
    QLabel* currentLabel_{nullptr};
    QLabel* summaryLabel_{nullptr};
    StatusIndicator* indicator_{nullptr};
    LatencyChartWidget* chart_{nullptr};
    QListWidget* recentList_{nullptr};
    QTimer* pollTimer_{nullptr};
};

} // namespace nettune::ui
