#include "hud/hud_enums.hpp"

#include "hud/value_codec.hpp"
#include "mo_types.hpp"

namespace mo {

std::string to_string(FpsLimitMethod v) { return v == FpsLimitMethod::Early ? "early" : "late"; }
std::string to_string(VSync v) { return std::to_string(static_cast<int>(v)); }
std::string to_string(HudPreset v) { return std::to_string(static_cast<int>(v)); }
std::string to_string(FcatOverlayEdge v) { return std::to_string(static_cast<int>(v)); }

std::string to_string(HudPosition v) {
    switch (v) {
        case HudPosition::TopLeft: return "top-left";
        case HudPosition::TopCenter: return "top-center";
        case HudPosition::TopRight: return "top-right";
        case HudPosition::MiddleLeft: return "middle-left";
        case HudPosition::MiddleRight: return "middle-right";
        case HudPosition::BottomLeft: return "bottom-left";
        case HudPosition::BottomRight: return "bottom-right";
    }
    return "top-left";
}

FpsLimitMethod parse_fps_limit_method(const std::string& s) {
    const std::string v = to_lower(trim(s));
    if (v == "early") return FpsLimitMethod::Early;
    if (v == "late") return FpsLimitMethod::Late;
    throw ConfigError(ConfigErrc::InvalidValue, "Invalid fps_limit_method '" + s + "': expected early or late");
}

VSync parse_vsync(const std::string& s) {
    return static_cast<VSync>(parse_int(s, 0, 3));
}

HudPreset parse_hud_preset(const std::string& s) {
    return static_cast<HudPreset>(parse_int(s, -1, 4));
}

HudPosition parse_hud_position(const std::string& s) {
    const std::string v = to_lower(trim(s));
    const auto& names = hud_position_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == v) return static_cast<HudPosition>(i);
    }
    throw ConfigError(ConfigErrc::InvalidValue, "Invalid position '" + s + "'");
}

FcatOverlayEdge parse_fcat_edge(const std::string& s) {
    return static_cast<FcatOverlayEdge>(parse_int(s, 0, 3));
}

const std::vector<std::string>& fps_limit_method_names() {
    static const std::vector<std::string> names = {"early", "late"};
    return names;
}

const std::vector<std::string>& vsync_names() {
    static const std::vector<std::string> names = {"0", "1", "2", "3"};
    return names;
}

const std::vector<std::string>& hud_preset_names() {
    static const std::vector<std::string> names = {"-1", "0", "1", "2", "3", "4"};
    return names;
}

// Order matches HudPosition.
const std::vector<std::string>& hud_position_names() {
    static const std::vector<std::string> names = {
        "top-left", "top-center", "top-right", "middle-left", "middle-right", "bottom-left", "bottom-right"};
    return names;
}

const std::vector<std::string>& fcat_edge_names() {
    static const std::vector<std::string> names = {"0", "1", "2", "3"};
    return names;
}

} // namespace mo
