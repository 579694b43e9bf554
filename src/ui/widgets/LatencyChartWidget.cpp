#include "ui/widgets/LatencyChartWidget.hpp"

#include "ui/widgets/Palette.hpp"

#include <QVBoxLayout>

#include <algorithm>
#include <cstddef>

namespace nettune::ui {

LatencyChartWidget::LatencyChartWidget(QWidget* parent) : QWidget(parent) {
    setupChart();
}

void LatencyChartWidget::setupChart() {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    chart_ = new QChart();
    chart_->setAnimationOptions(QChart::NoAnimation);
    chart_->legend()->hide();

    // Main latency series
    latencySeries_ = new QLineSeries(this);
    latencySeries_->setName("Latency");
    latencySeries_->setColor(QColor(0, 150, 255));
    chart_->addSeries(latencySeries_);

    goodPoints_ = addBandSeries(core::LatencyBand::Good);
    warningPoints_ = addBandSeries(core::LatencyBand::Warning);
    badPoints_ = addBandSeries(core::LatencyBand::Bad);
    failedPoints_ = addBandSeries(core::LatencyBand::Unknown);

    // Warning threshold line
    warningLine_ = new QLineSeries(this);
    warningLine_->setName("Warning");
    warningLine_->setColor(bandColor(core::LatencyBand::Warning));
    QPen warningPen = warningLine_->pen();
    warningPen.setStyle(Qt::DashLine);
    warningLine_->setPen(warningPen);
    chart_->addSeries(warningLine_);

    // Bad threshold line
    criticalLine_ = new QLineSeries(this);
    criticalLine_->setName("Bad");
    criticalLine_->setColor(bandColor(core::LatencyBand::Bad));
    QPen criticalPen = criticalLine_->pen();
    criticalPen.setStyle(Qt::DashLine);
    criticalLine_->setPen(criticalPen);
    chart_->addSeries(criticalLine_);

    // X axis (samples, oldest first)
    axisX_ = new QValueAxis(this);
    axisX_->setLabelFormat("%d");
    axisX_->setRange(0, maxDataPoints_ - 1);
    chart_->addAxis(axisX_, Qt::AlignBottom);

    // Y axis (latency in ms)
    axisY_ = new QValueAxis(this);
    axisY_->setTitleText("ms");
    axisY_->setLabelFormat("%d");
    axisY_->setRange(0, 100);
    chart_->addAxis(axisY_, Qt::AlignLeft);

    for (auto* series : chart_->series()) {
        series->attachAxis(axisX_);
        series->attachAxis(axisY_);
    }

    updateThresholdLines();

    chartView_ = new QChartView(chart_, this);
    chartView_->setRenderHint(QPainter::Antialiasing);
    layout->addWidget(chartView_);
}

QScatterSeries* LatencyChartWidget::addBandSeries(core::LatencyBand band) {
    auto* series = new QScatterSeries(this);
    series->setName(QString::fromStdString(core::latencyBandToString(band)));
    series->setColor(bandColor(band));
    series->setBorderColor(bandColor(band).darker(120));
    series->setMarkerSize(7.0);
    chart_->addSeries(series);
    return series;
}

void LatencyChartWidget::setHistory(const core::RollingHistory<core::ProbeResult>& history) {
    latencySeries_->clear();
    goodPoints_->clear();
    warningPoints_->clear();
    badPoints_->clear();
    failedPoints_->clear();

    // Only the newest maxDataPoints_ samples fit on the axis
    const auto& values = history.values();
    size_t first = values.size() > static_cast<size_t>(maxDataPoints_)
                       ? values.size() - static_cast<size_t>(maxDataPoints_)
                       : 0;

    double maxLatency = 0.0;
    int idx = 0;
    for (auto it = values.begin() + static_cast<std::ptrdiff_t>(first); it != values.end(); ++it) {
        const auto& result = *it;
        if (!result.success) {
            failedPoints_->append(idx++, 0.0);
            continue;
        }

        double latency = result.latencyMs();
        latencySeries_->append(idx, latency);
        switch (core::classify(result, thresholds_)) {
        case core::LatencyBand::Good:
            goodPoints_->append(idx, latency);
            break;
        case core::LatencyBand::Warning:
            warningPoints_->append(idx, latency);
            break;
        case core::LatencyBand::Bad:
            badPoints_->append(idx, latency);
            break;
        case core::LatencyBand::Unknown:
            failedPoints_->append(idx, 0.0);
            break;
        }
        maxLatency = std::max(maxLatency, latency);
        ++idx;
    }
    plottedSamples_ = idx;

    updateAxisRanges(maxLatency);
}

void LatencyChartWidget::setThresholds(const core::LatencyThresholds& thresholds) {
    thresholds_ = thresholds;
    updateThresholdLines();
}

void LatencyChartWidget::setMaxDataPoints(int maxPoints) {
    maxDataPoints_ = std::max(1, maxPoints);
    axisX_->setRange(0, std::max(1, maxDataPoints_ - 1));
    updateThresholdLines();
}

void LatencyChartWidget::clearChart() {
    latencySeries_->clear();
    goodPoints_->clear();
    warningPoints_->clear();
    badPoints_->clear();
    failedPoints_->clear();
    plottedSamples_ = 0;
    updateAxisRanges(0.0);
}

void LatencyChartWidget::updateThresholdLines() {
    double warning = static_cast<double>(thresholds_.warningMs);
    double bad = static_cast<double>(thresholds_.badMs);

    warningLine_->clear();
    warningLine_->append(0, warning);
    warningLine_->append(std::max(1, maxDataPoints_ - 1), warning);

    criticalLine_->clear();
    criticalLine_->append(0, bad);
    criticalLine_->append(std::max(1, maxDataPoints_ - 1), bad);
}

void LatencyChartWidget::updateAxisRanges(double maxLatency) {
    // Keep the bad threshold in view, with some headroom
    double top = std::max(maxLatency, static_cast<double>(thresholds_.badMs));
    axisY_->setRange(0, std::max(100.0, top * 1.2));
}

} // namespace nettune::ui
