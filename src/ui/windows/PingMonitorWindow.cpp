#include "ui/windows/PingMonitorWindow.hpp"

#include "app/Application.hpp"
#include "ui/widgets/Palette.hpp"

#include <QCloseEvent>
#include <QHBoxLayout>
#include <QShowEvent>
#include <QVBoxLayout>

namespace nettune::ui {

namespace {

QString sampleText(const core::ProbeResult& result) {
    if (!result.success) {
        return "Ping failed";
    }
    return QString("Ping: %1 ms").arg(qRound(result.latencyMs()));
}

} // namespace

PingMonitorWindow::PingMonitorWindow(QWidget* parent) : QWidget(parent, Qt::Window) {
    setWindowTitle("Ping Monitor");
    setMinimumSize(250, 420);

    setupUi();

    pollTimer_ = new QTimer(this);
    pollTimer_->setSingleShot(true);
    connect(pollTimer_, &QTimer::timeout, this, &PingMonitorWindow::onPollTick);

    auto& vm = app::Application::instance().pingMonitorViewModel();
    connect(&vm, &viewmodels::PingMonitorViewModel::sampleReceived, this,
            &PingMonitorWindow::onSampleReceived);
}

PingMonitorWindow::~PingMonitorWindow() {
    pollTimer_->stop();
}

void PingMonitorWindow::setupUi() {
    auto& vm = app::Application::instance().pingMonitorViewModel();

    auto* layout = new QVBoxLayout(this);

    targetLabel_ = new QLabel(QString("Target: %1").arg(QString::fromStdString(vm.settings().target)),
                              this);
    layout->addWidget(targetLabel_);

    // Current value
    auto* currentRow = new QHBoxLayout();
    indicator_ = new StatusIndicator(this);
    indicator_->setFixedSize(20, 20);
    currentLabel_ = new QLabel(this);
    QFont font = currentLabel_->font();
    font.setPointSize(font.pointSize() * 2);
    font.setBold(true);
    currentLabel_->setFont(font);
    currentRow->addWidget(indicator_);
    currentRow->addWidget(currentLabel_, 1);
    layout->addLayout(currentRow);

    chart_ = new LatencyChartWidget(this);
    chart_->setThresholds(vm.tracker().thresholds());
    chart_->setMaxDataPoints(static_cast<int>(vm.historyCapacity()));
    chart_->setMinimumHeight(180);
    layout->addWidget(chart_, 1);

    recentList_ = new QListWidget(this);
    recentList_->setSelectionMode(QAbstractItemView::NoSelection);
    recentList_->setMaximumHeight(120);
    layout->addWidget(recentList_);

    summaryLabel_ = new QLabel(this);
    layout->addWidget(summaryLabel_);

    showWaiting();
}

void PingMonitorWindow::showEvent(QShowEvent* event) {
    QWidget::showEvent(event);

    auto& vm = app::Application::instance().pingMonitorViewModel();
    if (!vm.isSessionOpen()) {
        showWaiting();
        if (!vm.openSession()) {
            currentLabel_->setText("Ping failed");
            return;
        }
    }
    scheduleNextPoll();
}

void PingMonitorWindow::closeEvent(QCloseEvent* event) {
    pollTimer_->stop();
    app::Application::instance().pingMonitorViewModel().closeSession();
    showWaiting();
    event->accept();
}

void PingMonitorWindow::onPollTick() {
    auto& vm = app::Application::instance().pingMonitorViewModel();
    if (!vm.isSessionOpen()) {
        return;
    }
    vm.poll();
    scheduleNextPoll();
}

void PingMonitorWindow::scheduleNextPoll() {
    auto& vm = app::Application::instance().pingMonitorViewModel();
    pollTimer_->start(static_cast<int>(vm.nextPollDelay().count()));
}

void PingMonitorWindow::onSampleReceived(const core::ProbeResult& result) {
    const auto& tracker = app::Application::instance().pingMonitorViewModel().tracker();
    auto band = tracker.currentBand();

    currentLabel_->setText(result.success ? QString("%1 ms").arg(qRound(result.latencyMs()))
                                          : QString("Ping failed"));
    currentLabel_->setStyleSheet(colorStyle(bandColor(band)));
    currentLabel_->setToolTip(QString::fromStdString(result.errorMessage));
    indicator_->setBand(band);

    chart_->setHistory(tracker.history());
    refreshRecentList();

    auto summary = tracker.summary();
    if (summary.samples > summary.failures) {
        summaryLabel_->setText(QString("min %1 / avg %2 / max %3 ms, loss %4%")
                                   .arg(summary.minLatencyMs, 0, 'f', 0)
                                   .arg(summary.avgLatencyMs, 0, 'f', 0)
                                   .arg(summary.maxLatencyMs, 0, 'f', 0)
                                   .arg(summary.failureRate(), 0, 'f', 0));
    } else {
        summaryLabel_->setText(QString("loss %1%").arg(summary.failureRate(), 0, 'f', 0));
    }
}

void PingMonitorWindow::refreshRecentList() {
    auto& vm = app::Application::instance().pingMonitorViewModel();
    const auto& thresholds = vm.tracker().thresholds();

    recentList_->clear();
    for (const auto& result : vm.recentNewestFirst()) {
        auto* item = new QListWidgetItem(sampleText(result), recentList_);
        item->setForeground(bandColor(core::classify(result, thresholds)));
    }
}

void PingMonitorWindow::showWaiting() {
    currentLabel_->setText("Waiting for ping data...");
    currentLabel_->setStyleSheet(colorStyle(bandColor(core::LatencyBand::Unknown)));
    currentLabel_->setToolTip({});
    indicator_->setBand(core::LatencyBand::Unknown);
    chart_->clearChart();
    recentList_->clear();
    summaryLabel_->clear();
}

} // namespace nettune::ui
