#pragma once

#include <chrono>
#include <string>
#include <stdexcept>

namespace dm::config {

// Accepts "<n>ms", "<n>s", "<n>m", "<n>h" or "<n>d". A bare number is seconds.
inline std::chrono::milliseconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    if (str.size() > 2 && (str.substr(str.size() - 2) == "ms" || str.substr(str.size() - 2) == "MS"))
        return std::chrono::milliseconds(std::stoull(str.substr(0, str.size() - 2)));

    const auto value = [&] { return std::stoull(str.substr(0, str.size() - 1)); };

    switch (str.back()) {
        case 's': case 'S': return std::chrono::seconds(value());
        case 'm': case 'M': return std::chrono::minutes(value());
        case 'h': case 'H': return std::chrono::hours(value());
        case 'd': case 'D': return std::chrono::hours(value() * 24);
        default: break;
    }

    return std::chrono::seconds(std::stoull(str));
}

inline std::string durationToString(const std::chrono::milliseconds ms) {
    if (ms.count() % 1000 != 0) return std::to_string(ms.count()) + "ms";
    const auto secs = ms.count() / 1000;
    if (secs != 0 && secs % 3600 == 0) return std::to_string(secs / 3600) + "h";
    if (secs != 0 && secs % 60 == 0) return std::to_string(secs / 60) + "m";
    return std::to_string(secs) + "s";
}

}
