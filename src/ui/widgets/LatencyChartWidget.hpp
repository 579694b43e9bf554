#pragma once

#include "core/types/LatencyBand.hpp"
#include "core/types/ProbeResult.hpp"
#include "core/types/RollingHistory.hpp"

#include <QChart>
#include <QChartView>
#include <QLineSeries>
#include <QScatterSeries>
#include <QValueAxis>
#include <QWidget>

namespace nettune::ui {

/**
 * @brief Line chart of the rolling latency history with threshold lines.
 *
 * Samples are plotted oldest to newest, at most maxDataPoints() of them (the
 * newest). Each point is colored by its band; failed probes are drawn on the
 * baseline in the Unknown color.
 */
class LatencyChartWidget : public QWidget {
    Q_OBJECT

public:
    explicit LatencyChartWidget(QWidget* parent = nullptr);

    void setHistory(const core::RollingHistory<core::ProbeResult>& history);
    void setThresholds(const core::LatencyThresholds& thresholds);
    void clearChart();

    void setMaxDataPoints(int maxPoints);
    int maxDataPoints() const { return maxDataPoints_; }

    /**
     * @brief Number of samples drawn by the last setHistory().
     */
    int plottedSamples() const { return plottedSamples_; }

private:
    void setupChart();
    QScatterSeries* addBandSeries(core::LatencyBand band);
    void updateThresholdLines();
    void updateAxisRanges(double maxLatency);

    QChartView* chartView_{nullptr};
    QChart* chart_{nullptr};
    QLineSeries* latencySeries_{nullptr};
    QScatterSeries* goodPoints_{nullptr};
    QScatterSeries* warningPoints_{nullptr};
    QScatterSeries* badPoints_{nullptr};
    QScatterSeries* failedPoints_{nullptr};
    QLineSeries* warningLine_{nullptr};
    QLineSeries* criticalLine_{nullptr};
    QValueAxis* axisX_{nullptr};
    QValueAxis* axisY_{nullptr};

    core::LatencyThresholds thresholds_;
    int maxDataPoints_{15};
    int plottedSamples_{0};
};

} // namespace nettune::ui
