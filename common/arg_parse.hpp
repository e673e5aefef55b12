#pragma once

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "common/time_grid.hpp"

namespace impactflow {

/// Whole-string decimal number.
inline bool parse_number(const char* arg, double& out) {
    char* end = nullptr;
    out = std::strtod(arg, &end);
    return end != arg && *end == '\0' && std::isfinite(out);
}

/// Non-negative integer made of digits only, at most max_value.
inline bool parse_count(const char* arg, uint64_t max_value, uint64_t& out) {
    if (*arg == '\0') return false;
    for (const char* p = arg; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(arg, &end, 10);
    if (errno == ERANGE || *end != '\0' || v > max_value) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

/// Seconds (fractions allowed) to whole microseconds; fails outside the int64 range.
inline bool parse_seconds_us(const char* arg, int64_t& out_us) {
    double sec = 0.0;
    if (!parse_number(arg, sec)) return false;
    const double us = std::round(sec * static_cast<double>(kMicrosPerSecond));
    if (!(std::fabs(us) < 9.0e18)) return false;
    out_us = static_cast<int64_t>(us);
    return true;
}

/// "A,B,,C" -> {"A", "B", "C"}
inline std::vector<std::string> split_list(const char* arg) {
    std::vector<std::string> out;
    std::istringstream ss(arg);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

} // namespace impactflow
