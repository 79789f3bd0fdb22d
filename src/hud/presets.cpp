#include "hud/presets.hpp"

#include "hud/config_parser.hpp"
#include "hud/config_writer.hpp"
#include "hud/param_registry.hpp"

namespace mo {

const std::string& preset_text(HudPreset preset) {
    static const std::string none;
    static const std::string off =
        "no_display=1\n";
    static const std::string fps_only =
        "legacy_layout=0\n"
        "cpu_stats=0\n"
        "gpu_stats=0\n"
        "fps\n"
        "frametime=0\n";
    static const std::string horizontal =
        "legacy_layout=0\n"
        "horizontal\n"
        "horizontal_stretch=0\n"
        "table_columns=20\n"
        "hud_no_margin\n"
        "gpu_stats\n"
        "cpu_stats\n"
        "ram\n"
        "vram\n"
        "fps\n"
        "frametime=0\n"
        "frame_timing\n";
    static const std::string extended =
        "legacy_layout=0\n"
        "gpu_stats\n"
        "gpu_temp\n"
        "gpu_core_clock\n"
        "gpu_mem_clock\n"
        "cpu_stats\n"
        "cpu_temp\n"
        "core_load\n"
        "vram\n"
        "ram\n"
        "fps\n"
        "frametime\n"
        "frame_timing\n"
        "arch\n"
        "resolution\n";
    static const std::string detailed =
        "legacy_layout=0\n"
        "time\n"
        "gpu_name\n"
        "engine_version\n"
        "vulkan_driver\n"
        "gpu_stats\n"
        "gpu_temp\n"
        "gpu_junction_temp\n"
        "gpu_core_clock\n"
        "gpu_mem_temp\n"
        "gpu_mem_clock\n"
        "gpu_power\n"
        "throttling_status\n"
        "cpu_stats\n"
        "cpu_temp\n"
        "cpu_power\n"
        "cpu_mhz\n"
        "core_load\n"
        "io_read\n"
        "io_write\n"
        "vram\n"
        "ram\n"
        "swap\n"
        "procmem\n"
        "battery\n"
        "fps\n"
        "frametime\n"
        "frame_timing\n"
        "frame_count\n"
        "show_fps_limit\n"
        "wine\n"
        "arch\n"
        "resolution\n"
        "gamemode\n"
        "vkbasalt\n";

    switch (preset) {
        case HudPreset::Off: return off;
        case HudPreset::FpsOnly: return fps_only;
        case HudPreset::Horizontal: return horizontal;
        case HudPreset::Extended: return extended;
        case HudPreset::Detailed: return detailed;
        case HudPreset::Default: break;
    }
    return none;
}

std::string preset_title(HudPreset preset) {
    switch (preset) {
        case HudPreset::Default: return "default";
        case HudPreset::Off: return "off";
        case HudPreset::FpsOnly: return "fps only";
        case HudPreset::Horizontal: return "horizontal";
        case HudPreset::Extended: return "extended";
        case HudPreset::Detailed: return "detailed";
    }
    return "unknown";
}

OverlayConfig apply_preset(const OverlayConfig& config, HudPreset preset) {
    if (preset == HudPreset::Default) return config;
    WriteOptions opts;
    opts.header = false;
    std::string user = write_config(config, opts);
    // Explicit values equal to the default are not written but still override the preset
    for (const auto& key : config.explicit_keys) {
        if (!is_default(config, key)) continue;
        auto value = get_value(config, key);
        if (value) user += key + "=" + *value + "\n";
    }
    auto result = parse_config(preset_text(preset) + user);
    result.config.preset = HudPreset::Default;
    return result.config;
}

} // namespace mo
