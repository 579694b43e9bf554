#include "ui/widgets/StatusIndicator.hpp"

#include "ui/widgets/Palette.hpp"

#include <QPainter>

namespace nettune::ui {

StatusIndicator::StatusIndicator(QWidget* parent) : QWidget(parent) {
    setMinimumSize(16, 16);

    pulseAnimation_ = new QPropertyAnimation(this, "pulseOpacity", this);
    pulseAnimation_->setKeyValueAt(0.0, 1.0);
    pulseAnimation_->setKeyValueAt(0.5, 0.25);
    pulseAnimation_->setKeyValueAt(1.0, 1.0);
    pulseAnimation_->setEasingCurve(QEasingCurve::InOutSine);
    pulseAnimation_->setLoopCount(-1);
}

int StatusIndicator::pulseDurationMs(core::LatencyBand band) {
    switch (band) {
    case core::LatencyBand::Warning:
        return kWarningPulseMs;
    case core::LatencyBand::Bad:
        return kBadPulseMs;
    case core::LatencyBand::Good:
    case core::LatencyBand::Unknown:
        break;
    }
    return 0;
}

void StatusIndicator::setBand(core::LatencyBand band) {
    if (band_ == band) {
        return;
    }

    band_ = band;
    updateAnimation();
    update();
}

bool StatusIndicator::isPulsing() const {
    return pulseAnimation_->state() == QAbstractAnimation::Running;
}

void StatusIndicator::setPulseOpacity(qreal opacity) {
    pulseOpacity_ = opacity;
    update();
}

void StatusIndicator::updateAnimation() {
    pulseAnimation_->stop();
    pulseOpacity_ = 1.0;

    int duration = pulseDurationMs(band_);
    if (duration > 0) {
        pulseAnimation_->setDuration(duration);
        pulseAnimation_->start();
    }
}

void StatusIndicator::paintEvent(QPaintEvent* /*event*/) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    QColor color = bandColor(band_);
    const int margin = 3;
    QRect dot = rect().adjusted(margin, margin, -margin, -margin);

    if (isHollow()) {
        painter.setBrush(Qt::NoBrush);
        painter.setPen(QPen(color.darker(130), 2));
        painter.drawEllipse(dot);
        return;
    }

    // Alarm ring stays solid while the dot pulses
    if (band_ == core::LatencyBand::Bad) {
        painter.setBrush(Qt::NoBrush);
        painter.setPen(QPen(color, 1.5));
        painter.drawEllipse(rect().adjusted(1, 1, -1, -1));
    }

    color.setAlphaF(static_cast<float>(pulseOpacity_));
    painter.setBrush(color);
    painter.setPen(QPen(color.darker(120), 1));
    painter.drawEllipse(dot);
}

} // namespace nettune::ui
