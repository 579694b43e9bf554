#include "ui/widgets/Palette.hpp"

namespace nettune::ui {

namespace {

const QColor kGreen(0, 200, 0);
const QColor kYellow(230, 200, 0);
const QColor kRed(220, 0, 0);
const QColor kLightGray(200, 200, 200);

} // namespace

QColor bandColor(core::LatencyBand band) {
    switch (band) {
    case core::LatencyBand::Good:
        return kGreen;
    case core::LatencyBand::Warning:
        return kYellow;
    case core::LatencyBand::Bad:
        return kRed;
    case core::LatencyBand::Unknown:
    default:
        return kLightGray;
    }
}

QColor dnsStateColor(core::DnsState::Kind kind) {
    switch (kind) {
    case core::DnsState::Kind::Static:
        return kGreen;
    case core::DnsState::Kind::Dhcp:
        return kYellow;
    case core::DnsState::Kind::None:
    default:
        return kRed;
    }
}

QColor appStateColor(core::AppState::Kind kind) {
    switch (kind) {
    case core::AppState::Kind::Success:
        return kGreen;
    case core::AppState::Kind::Warning:
        return kYellow;
    case core::AppState::Kind::Error:
        return kRed;
    case core::AppState::Kind::Idle:
    case core::AppState::Kind::Processing:
    default:
        return {};
    }
}

QString colorStyle(const QColor& color) {
    if (!color.isValid()) {
        return {};
    }
    return QString("color: %1;").arg(color.name());
}

} // namespace nettune::ui
