#pragma once

#include "core/types/LatencyBand.hpp"

#include <QPropertyAnimation>
#include <QWidget>

namespace nettune::ui {

/**
 * @brief Colored dot showing the latency band of the latest sample.
 *
 * Good is drawn steady. Warning pulses slowly and Bad pulses fast with an
 * alarm ring around the dot. Unknown (no sample yet, or a failed probe) is
 * drawn as a hollow outline.
 */
class StatusIndicator : public QWidget {
    Q_OBJECT
    Q_PROPERTY(qreal pulseOpacity READ pulseOpacity WRITE setPulseOpacity)

public:
    static constexpr int kWarningPulseMs = 1600;
    static constexpr int kBadPulseMs = 500;

    explicit StatusIndicator(QWidget* parent = nullptr);

    void setBand(core::LatencyBand band);
    core::LatencyBand band() const { return band_; }

    /**
     * @brief Length of one pulse cycle for a band, 0 when drawn steady.
     */
    static int pulseDurationMs(core::LatencyBand band);

    bool isPulsing() const;
    bool isHollow() const { return band_ == core::LatencyBand::Unknown; }

    qreal pulseOpacity() const { return pulseOpacity_; }
    void setPulseOpacity(qreal opacity);

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    void updateAnimation();

    core::LatencyBand band_{core::LatencyBand::Unknown};
    qreal pulseOpacity_{1.0};
    QPropertyAnimation* pulseAnimation_{nullptr};
};

} // namespace nettune::ui
