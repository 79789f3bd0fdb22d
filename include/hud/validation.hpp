#pragma once

#include <string>
#include <vector>

#include "hud/config_parser.hpp"
#include "hud/overlay_config.hpp"

namespace mo {

struct ValidationIssue {
    Severity severity = Severity::Warning;
    std::string key;
    std::string message;
};

// Checks value ranges and cross-parameter rules that the parser cannot see
// one line at a time.
std::vector<ValidationIssue> validate(const OverlayConfig& config);

bool has_errors(const std::vector<ValidationIssue>& issues);

// Glyph range names MangoHud recognizes for font_glyph_ranges.
const std::vector<std::string>& known_glyph_ranges();

} // namespace mo
