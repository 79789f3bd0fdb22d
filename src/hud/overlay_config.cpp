#include "hud/overlay_config.hpp"

namespace mo {

OverlayConfig default_config(bool legacy_layout) {
    OverlayConfig c;
    c.legacy_layout = legacy_layout;
    if (!legacy_layout) {
        c.gpu_stats = false;
        c.cpu_stats = false;
        c.fps = false;
        c.frametime = false;
        c.frame_timing = false;
    }
    return c;
}

} // namespace mo
