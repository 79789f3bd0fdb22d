#pragma once

#include <string>
#include <vector>

#include "hud/config_parser.hpp"
#include "hud/overlay_config.hpp"
#include "mo_types.hpp"

namespace mo {

// A MangoHud config opened for editing.
struct Document {
    std::string name;
    fs::path path; // empty until first saved
    OverlayConfig config;
    std::vector<Diagnostic> diagnostics; // from the last load
    bool dirty = false;
};

} // namespace mo
