#pragma once

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace plexus::config::detail {

inline bool parse_bool(const std::string& value, bool& out) {
    std::string lowered;
    lowered.reserve(value.size());
    for (char ch : value) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}

// Accepts "inf" and "nan" as well; NaN is meaningful to the options resolver.
inline bool parse_double(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || errno == ERANGE) {
        return false;
    }
    out = parsed;
    return true;
}

inline bool parse_uint32(const std::string& value, std::uint32_t& out) {
    if (value.empty() || value.front() == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = std::strtoull(value.c_str(), &end, 0);
    if (end != value.c_str() + value.size() || errno == ERANGE || parsed > UINT32_MAX) {
        return false;
    }
    out = static_cast<std::uint32_t>(parsed);
    return true;
}

} // namespace plexus::config::detail
