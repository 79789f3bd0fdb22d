#include "hud/color.hpp"

#include <cctype>
#include <cstdio>

#include "mo_types.hpp"

namespace mo {

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

Rgb8 parse_color(const std::string& text) {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
    else if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.erase(0, 2);

    if (hex.size() != 6) {
        throw ConfigError(ConfigErrc::InvalidValue, "Invalid color '" + text + "': expected RRGGBB");
    }
    uint8_t bytes[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(hex[i * 2]);
        int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigError(ConfigErrc::InvalidValue, "Invalid color '" + text + "': not a hex value");
        }
        bytes[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Rgb8{bytes[0], bytes[1], bytes[2]};
}

std::string format_color(const Rgb8& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02X%02X%02X", c.r, c.g, c.b);
    return buf;
}

} // namespace mo
