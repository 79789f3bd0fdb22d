#pragma once
#include <cstdint>
#include <string>

namespace mo {

struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb8& a, const Rgb8& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Rgb8& a, const Rgb8& b) { return !(a == b); }

// Accepts RRGGBB, #RRGGBB or 0xRRGGBB (any case). Throws ConfigError on
// anything else.
Rgb8 parse_color(const std::string& text);

// Six upper-case hex digits, no prefix.
std::string format_color(const Rgb8& c);

namespace colors {
// MangoHud's default palette.
constexpr Rgb8 WHITE{0xFF, 0xFF, 0xFF};
constexpr Rgb8 BLACK{0x00, 0x00, 0x00};
constexpr Rgb8 ALMOST_BLACK{0x02, 0x02, 0x02};
constexpr Rgb8 DARK_LIME_GREEN{0x2E, 0x97, 0x62};
constexpr Rgb8 LIME_GREEN{0x00, 0xFF, 0x00};
constexpr Rgb8 GREEN{0x39, 0xF9, 0x00};
constexpr Rgb8 BLUE{0x2E, 0x97, 0xCB};
constexpr Rgb8 LIGHT_MAGENTA{0xAD, 0x64, 0xC1};
constexpr Rgb8 LIGHT_PINK{0xC2, 0x66, 0x93};
constexpr Rgb8 SOFT_RED{0xEB, 0x5B, 0x5B};
constexpr Rgb8 LIGHT_VIOLET{0xA4, 0x91, 0xD3};
constexpr Rgb8 LIGHT_RED{0xFF, 0x90, 0x78};
constexpr Rgb8 DARK_RED{0xB2, 0x22, 0x22};
constexpr Rgb8 VIVID_YELLOW{0xFD, 0xFD, 0x09};
} // namespace colors

} // namespace mo
