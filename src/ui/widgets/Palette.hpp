#pragma once

#include "core/types/DnsTypes.hpp"
#include "core/types/LatencyBand.hpp"

#include <QColor>

namespace nettune::ui {

// Colors shared by the monitor and DNS windows

QColor bandColor(core::LatencyBand band);
QColor dnsStateColor(core::DnsState::Kind kind);

/**
 * @brief Color of the app-state line; invalid for Idle/Processing (use the palette text color).
 */
QColor appStateColor(core::AppState::Kind kind);

/**
 * @brief Style sheet fragment setting the text color.
 */
QString colorStyle(const QColor& color);

} // namespace nettune::ui
