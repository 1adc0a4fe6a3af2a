#include "core/duration_parser.h"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <vector>

namespace subdub {

namespace {

bool parseNonNegative(const std::string& token, bool allowFraction, double& out) {
    if (token.empty()) {
        return false;
    }
    bool seenDot = false;
    for (char c : token) {
        if (c == '.') {
            if (!allowFraction || seenDot) {
                return false;
            }
            seenDot = true;
            continue;
        }
        if (c < '0' || c > '9') {
            return false;
        }
    }
    try {
        out = std::stod(token);
    } catch (const std::exception&) {
        return false;
    }
    return std::isfinite(out);
}

}  // namespace

std::optional<double> parseDurationString(const std::string& text) {
    std::string trimmed;
    for (char c : text) {
        if (c != ' ' && c != '\t') {
            trimmed.push_back(c);
        }
    }
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    std::stringstream ss(trimmed);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (!trimmed.empty() && trimmed.back() == ':') {
        return std::nullopt;
    }

    double hours = 0.0;
    double minutes = 0.0;
    double seconds = 0.0;
    switch (parts.size()) {
    case 1:
        if (!parseNonNegative(parts[0], true, seconds)) {
            return std::nullopt;
        }
        return seconds;
    case 2:
        if (!parseNonNegative(parts[0], false, minutes) ||
            !parseNonNegative(parts[1], true, seconds)) {
            return std::nullopt;
        }
        break;
    case 3:
        if (!parseNonNegative(parts[0], false, hours) ||
            !parseNonNegative(parts[1], false, minutes) ||
            !parseNonNegative(parts[2], true, seconds)) {
            return std::nullopt;
        }
        break;
    default:
        return std::nullopt;
    }

    if (minutes >= 60.0 || seconds >= 60.0) {
        return std::nullopt;
    }
    return hours * 3600.0 + minutes * 60.0 + seconds;
}

std::string formatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    auto totalMs = static_cast<long long>(std::llround(seconds * 1000.0));
    long long h = totalMs / 3600000;
    long long m = (totalMs / 60000) % 60;
    long long s = (totalMs / 1000) % 60;
    long long ms = totalMs % 1000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", h, m, s, ms);
    return std::string(buf);
}

}  // namespace subdub
