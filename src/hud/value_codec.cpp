#include "hud/value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "mo_types.hpp"

namespace mo {

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split_list(const std::string& s, const std::string& separators) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (separators.find(c) != std::string::npos) {
            auto t = trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur += c;
        }
    }
    auto t = trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

std::string join_list(const std::vector<std::string>& items, char sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

bool parse_bool(const std::string& s) {
    const std::string v = to_lower(trim(s));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(ConfigErrc::InvalidValue, "Invalid boolean '" + s + "': expected 0 or 1");
}

long long parse_int(const std::string& s, long long min_value, long long max_value) {
    const std::string v = trim(s);
    if (v.empty()) throw ConfigError(ConfigErrc::InvalidValue, "Expected an integer, got an empty value");
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(v.c_str(), &end, 10);
    if (errno == ERANGE || end == v.c_str() || *end != '\0') {
        throw ConfigError(ConfigErrc::InvalidValue, "Invalid integer '" + s + "'");
    }
    if (n < min_value || n > max_value) {
        throw ConfigError(ConfigErrc::InvalidValue, "Value " + v + " out of range [" +
                          std::to_string(min_value) + ", " + std::to_string(max_value) + "]");
    }
    return n;
}

double parse_float(const std::string& s) {
    const std::string v = trim(s);
    if (v.empty()) throw ConfigError(ConfigErrc::InvalidValue, "Expected a number, got an empty value");
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (errno == ERANGE || end == v.c_str() || *end != '\0' || !std::isfinite(d)) {
        throw ConfigError(ConfigErrc::InvalidValue, "Invalid number '" + s + "'");
    }
    return d;
}

std::string format_float(double v) {
    char buf[32];
    // Whole values would otherwise come out as "1.4e+02"
    if (std::fabs(v) < 1e15 && std::floor(v) == v) {
        std::snprintf(buf, sizeof(buf), "%.0f", v);
        std::string out = buf;
        return out == "-0" ? "0" : out;
    }
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    std::string out = buf;
    if (out == "-0") out = "0";
    return out;
}

} // namespace mo
