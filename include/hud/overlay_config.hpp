// In-memory model of a MangoHud config file.
// Parameter reference:
// https://github.com/flightlessmango/MangoHud#environment-variables-mangohud_config-and-mangohud_configfile
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hud/color.hpp"
#include "hud/hud_enums.hpp"
#include "hud/keybind.hpp"

namespace mo {

// One HUD element in file order. Only meaningful when legacy_layout is off,
// where MangoHud draws elements in the order they appear.
struct LayoutEntry {
    std::string key;
    std::string value;
};

// A key the registry does not know. Kept so saving does not drop it.
struct ExtraEntry {
    std::string key;
    std::string value;
    bool bare = false; // written as "key" instead of "key=value"
};

inline bool operator==(const LayoutEntry& a, const LayoutEntry& b) { return a.key == b.key && a.value == b.value; }
inline bool operator==(const ExtraEntry& a, const ExtraEntry& b) {
    return a.key == b.key && a.value == b.value && a.bare == b.bare;
}

struct OverlayConfig {
    // Performance
    std::vector<int> fps_limit = {0};
    FpsLimitMethod fps_limit_method = FpsLimitMethod::Late;
    std::optional<VSync> vsync;
    std::optional<int> gl_vsync;
    std::optional<int> picmip; // [-16, 16] mip-map LoD bias
    std::optional<int> af;     // [0, 16] anisotropic filtering level
    bool bicubic = false;
    bool trilinear = false;
    bool retro = false;

    // Core visual
    bool legacy_layout = true; // off: no default elements, file order is draw order
    HudPreset preset = HudPreset::Default;
    bool histogram = false;
    std::string custom_text_center;
    bool time = false;
    std::string time_format = "%T";
    bool version = false;

    // GPU
    bool gpu_stats = true;
    bool gpu_temp = false;
    bool gpu_junction_temp = false;
    bool gpu_core_clock = false;
    bool gpu_mem_temp = false;  // needs vram
    bool gpu_mem_clock = false; // needs vram
    bool gpu_power = false;
    std::string gpu_text;
    bool gpu_load_change = false;
    std::array<int, 2> gpu_load_value = {60, 90};
    std::array<Rgb8, 3> gpu_load_color = {colors::GREEN, colors::VIVID_YELLOW, colors::DARK_RED};

    // CPU
    bool cpu_stats = true;
    bool cpu_temp = false;
    bool cpu_power = false;
    std::string cpu_text;
    bool cpu_mhz = false;
    bool cpu_load_change = false;
    std::array<int, 2> cpu_load_value = {60, 90};
    std::array<Rgb8, 3> cpu_load_color = {colors::GREEN, colors::VIVID_YELLOW, colors::DARK_RED};
    bool core_load = false;
    bool core_load_change = false;

    // IO
    bool io_read = false;
    bool io_write = false;

    // Memory
    bool vram = false;
    bool ram = false;
    bool swap = false;
    bool procmem = false;
    bool procmem_shared = false;
    bool procmem_virt = false;

    // Battery
    bool battery = false;
    bool battery_icon = false;
    bool gamepad_battery = false;
    bool gamepad_battery_icon = false;

    // FPS
    bool fps = true;
    std::chrono::milliseconds fps_sampling_period{500};
    bool fps_color_change = false;
    std::array<int, 2> fps_value = {30, 60};
    std::array<Rgb8, 3> fps_color = {colors::DARK_RED, colors::VIVID_YELLOW, colors::GREEN};
    bool frametime = true;
    bool frame_timing = true;
    bool frame_count = false;
    bool show_fps_limit = false;

    // Misc
    bool throttling_status = false;
    bool engine_version = false;
    bool gpu_name = false;
    bool vulkan_driver = false;
    bool wine = false;
    bool exec_name = false;
    bool arch = false;
    bool gamemode = false;
    bool vkbasalt = false;
    bool resolution = false;
    std::string custom_text;
    std::string exec; // shell command

    // Media
    bool media_player = false;
    std::string media_player_name;
    std::string media_player_format = "{title};{artist};{album}";

    // Font
    double font_size = 24.0;
    double font_scale = 1.0;
    double font_size_text = 24.0;
    double font_scale_media_player = 0.55;
    bool no_small_font = false;
    std::string font_file;
    std::string font_file_text;
    std::vector<std::string> font_glyph_ranges;
    bool text_outline = true;
    double text_outline_thickness = 1.5;

    // Appearance
    HudPosition position = HudPosition::TopLeft;
    double round_corners = 0.0;
    bool hud_no_margin = false;
    bool hud_compact = false;
    bool horizontal = false;
    bool horizontal_stretch = true; // only applies with horizontal
    bool no_display = false;
    double offset_x = 0.0;
    double offset_y = 0.0;
    double width = 0.0;
    double height = 140.0;
    int table_columns = 3;
    double cellpadding_y = -0.085;
    double background_alpha = 0.5;
    double alpha = 1.0;

    // FCAT
    bool fcat = false;
    int fcat_overlay_width = 24;
    FcatOverlayEdge fcat_screen_edge = FcatOverlayEdge::Left;

    // Colors
    Rgb8 text_color = colors::WHITE;
    Rgb8 gpu_color = colors::DARK_LIME_GREEN;
    Rgb8 cpu_color = colors::BLUE;
    Rgb8 vram_color = colors::LIGHT_MAGENTA;
    Rgb8 ram_color = colors::LIGHT_PINK;
    Rgb8 engine_color = colors::SOFT_RED;
    Rgb8 io_color = colors::LIGHT_VIOLET;
    Rgb8 frametime_color = colors::LIME_GREEN;
    Rgb8 background_color = colors::ALMOST_BLACK;
    Rgb8 media_player_color = colors::WHITE;
    Rgb8 wine_color = colors::SOFT_RED;
    Rgb8 battery_color = colors::LIGHT_RED;
    Rgb8 text_outline_color = colors::BLACK;

    // Other
    std::string pci_dev;
    std::vector<std::string> blacklist; // process names
    std::string control;                // socket name

    // OpenGL workarounds
    std::optional<int> gl_bind_framebuffer;

    // Keybinds
    Keybind toggle_hud{{KeyModifier::ShiftR}, "F12"};
    Keybind toggle_hud_position{{KeyModifier::ShiftR}, "F11"};
    Keybind toggle_fps_limit{{KeyModifier::ShiftL}, "F1"};
    Keybind toggle_logging{{KeyModifier::ShiftL}, "F2"};
    Keybind reload_cfg{{KeyModifier::ShiftL}, "F4"};
    Keybind upload_log{{KeyModifier::ShiftL}, "F3"};

    // Logging
    bool autostart_log = false;
    std::chrono::seconds log_duration{0};
    std::chrono::milliseconds log_interval{0};
    std::string output_folder;
    bool permit_upload = false;
    std::string benchmark_percentiles = "97+AVG";

    std::vector<LayoutEntry> layout;
    std::vector<ExtraEntry> extras;

    // Registered keys assigned through set_value, even to their default.
    // Not part of the config's value; same_values ignores it.
    std::set<std::string> explicit_keys;
};

// Defaults as MangoHud applies them. With legacy_layout off the default
// elements (gpu_stats, cpu_stats, fps, frametime, frame_timing) start off.
OverlayConfig default_config(bool legacy_layout = true);

} // namespace mo
