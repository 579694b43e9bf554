#include "core/types/Ipv4Address.hpp"

namespace nettune::core {

namespace {

bool isValidOctet(std::string_view part) {
    if (part.empty() || part.size() > 3) {
        return false;
    }

    int value = 0;
    for (char c : part) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    return value <= 255;
}

} // namespace

bool isValidIpv4(std::string_view text) {
    int parts = 0;
    size_t start = 0;

    while (true) {
        size_t dot = text.find('.', start);
        auto part = text.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                      : dot - start);
        if (!isValidOctet(part)) {
            return false;
        }
        ++parts;

        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }

    return parts == 4;
}

bool isAcceptableIpv4Input(std::string_view text) {
    return text.empty() || isValidIpv4(text);
}

} // namespace nettune::core
