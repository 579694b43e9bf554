#pragma once

#include <string>
#include <string_view>

namespace nettune::core {

/**
 * @brief Checks a dotted-quad IPv4 string.
 *
 * Accepts exactly four dot-separated parts of 1-3 ASCII digits, each in
 * [0, 255]. Leading zeros are accepted as-is ("010" reads as 10). No
 * surrounding whitespace or sign characters are allowed.
 */
bool isValidIpv4(std::string_view text);

/**
 * @brief Checks a user input field.
 *
 * An empty field is accepted as "not filled in yet"; anything else must be a
 * valid IPv4 address.
 */
bool isAcceptableIpv4Input(std::string_view text);

} // namespace nettune::core
