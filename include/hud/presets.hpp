#pragma once

#include <string>

#include "hud/overlay_config.hpp"

namespace mo {

// Config lines for a built-in preset, modeled on MangoHud's presets.conf.
// Empty for HudPreset::Default.
const std::string& preset_text(HudPreset preset);

std::string preset_title(HudPreset preset);

// Returns `config` with the preset's parameters applied underneath it:
// values the config sets explicitly still win, as in MangoHud where the
// user file is read after the preset. The result has preset = Default since
// the preset's values are now explicit.
OverlayConfig apply_preset(const OverlayConfig& config, HudPreset preset);

} // namespace mo
