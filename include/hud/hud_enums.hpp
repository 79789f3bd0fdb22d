#pragma once
#include <string>
#include <vector>

namespace mo {

enum class FpsLimitMethod { Early, Late };

enum class VSync { Adaptive = 0, Off = 1, Mailbox = 2, On = 3 };

enum class HudPreset {
    Default = -1, Off = 0, FpsOnly = 1, Horizontal = 2, Extended = 3, Detailed = 4,
};

enum class HudPosition {
    TopLeft, TopCenter, TopRight, MiddleLeft, MiddleRight, BottomLeft, BottomRight,
};

enum class FcatOverlayEdge { Left = 0, Bottom = 1, Right = 2, Top = 3 };

std::string to_string(FpsLimitMethod v);
std::string to_string(VSync v);
std::string to_string(HudPreset v);
std::string to_string(HudPosition v);
std::string to_string(FcatOverlayEdge v);

// Each parser throws ConfigError(InvalidValue) on unknown text.
FpsLimitMethod parse_fps_limit_method(const std::string& s);
VSync parse_vsync(const std::string& s);
HudPreset parse_hud_preset(const std::string& s);
HudPosition parse_hud_position(const std::string& s);
FcatOverlayEdge parse_fcat_edge(const std::string& s);

// File spellings, used by the editors for radio lists.
const std::vector<std::string>& fps_limit_method_names();
const std::vector<std::string>& vsync_names();
const std::vector<std::string>& hud_preset_names();
const std::vector<std::string>& hud_position_names();
const std::vector<std::string>& fcat_edge_names();

} // namespace mo
