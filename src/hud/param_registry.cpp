#include "hud/param_registry.hpp"

#include <algorithm>
#include <unordered_map>

#include "hud/value_codec.hpp"
#include "mo_types.hpp"

namespace mo {

const char* to_string(ParamKind kind) {
    switch (kind) {
        case ParamKind::Bool: return "bool";
        case ParamKind::Int: return "int";
        case ParamKind::Float: return "float";
        case ParamKind::String: return "string";
        case ParamKind::Path: return "path";
        case ParamKind::Color: return "color";
        case ParamKind::ColorList: return "color[3]";
        case ParamKind::IntPair: return "int[2]";
        case ParamKind::IntList: return "int list";
        case ParamKind::StringList: return "string list";
        case ParamKind::Enum: return "enum";
        case ParamKind::Keybind: return "keybind";
        case ParamKind::Duration: return "duration";
        case ParamKind::OptionalInt: return "int?";
    }
    return "unknown";
}

namespace {

template <typename T>
using Field = T OverlayConfig::*;

template <typename T>
std::function<void(OverlayConfig&, const OverlayConfig&)> copier(Field<T> f) {
    return [f](OverlayConfig& dst, const OverlayConfig& src) { dst.*f = src.*f; };
}

ParamSpec make(const std::string& key, const std::string& section, ParamKind kind,
               const std::string& description) {
    ParamSpec p;
    p.key = key;
    p.section = section;
    p.kind = kind;
    p.description = description;
    return p;
}

ParamSpec bool_param(const std::string& key, const std::string& section, const std::string& desc,
                     Field<bool> f, bool orderable = false) {
    auto p = make(key, section, ParamKind::Bool, desc);
    p.orderable = orderable;
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = parse_bool(v); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return std::string(c.*f ? "1" : "0"); };
    p.copy_from = copier(f);
    return p;
}

ParamSpec int_param(const std::string& key, const std::string& section, const std::string& desc,
                    Field<int> f, long long lo, long long hi) {
    auto p = make(key, section, ParamKind::Int, desc);
    p.parse = [f, lo, hi](OverlayConfig& c, const std::string& v) { c.*f = static_cast<int>(parse_int(v, lo, hi)); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return std::to_string(c.*f); };
    p.copy_from = copier(f);
    return p;
}

ParamSpec optional_int_param(const std::string& key, const std::string& section, const std::string& desc,
                             Field<std::optional<int>> f, long long lo, long long hi) {
    auto p = make(key, section, ParamKind::OptionalInt, desc);
    p.parse = [f, lo, hi](OverlayConfig& c, const std::string& v) {
        if (trim(v).empty()) { (c.*f).reset(); return; }
        c.*f = static_cast<int>(parse_int(v, lo, hi));
    };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> {
        if (!(c.*f)) return std::nullopt;
        return std::to_string(*(c.*f));
    };
    p.copy_from = copier(f);
    return p;
}

ParamSpec float_param(const std::string& key, const std::string& section, const std::string& desc,
                      Field<double> f) {
    auto p = make(key, section, ParamKind::Float, desc);
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = parse_float(v); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return format_float(c.*f); };
    p.copy_from = copier(f);
    return p;
}

ParamSpec string_param(const std::string& key, const std::string& section, const std::string& desc,
                       Field<std::string> f, ParamKind kind = ParamKind::String,
                       bool orderable = false, bool repeatable = false) {
    auto p = make(key, section, kind, desc);
    p.orderable = orderable;
    p.repeatable = repeatable;
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = trim(v); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return c.*f; };
    p.copy_from = copier(f);
    return p;
}

ParamSpec color_param(const std::string& key, const std::string& desc, Field<Rgb8> f) {
    auto p = make(key, "Colors", ParamKind::Color, desc);
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = parse_color(trim(v)); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return format_color(c.*f); };
    p.copy_from = copier(f);
    return p;
}

ParamSpec color_list_param(const std::string& key, const std::string& section, const std::string& desc,
                           Field<std::array<Rgb8, 3>> f) {
    auto p = make(key, section, ParamKind::ColorList, desc);
    p.is_list = true;
    p.parse = [f, key](OverlayConfig& c, const std::string& v) {
        auto items = split_list(v);
        if (items.size() != 3) {
            throw ConfigError(ConfigErrc::InvalidValue, key + " expects 3 colors, got " + std::to_string(items.size()));
        }
        std::array<Rgb8, 3> out;
        for (size_t i = 0; i < 3; ++i) out[i] = parse_color(items[i]);
        c.*f = out;
    };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> {
        std::vector<std::string> items;
        for (const auto& col : c.*f) items.push_back(format_color(col));
        return join_list(items);
    };
    p.copy_from = copier(f);
    return p;
}

ParamSpec int_pair_param(const std::string& key, const std::string& section, const std::string& desc,
                         Field<std::array<int, 2>> f, long long lo, long long hi) {
    auto p = make(key, section, ParamKind::IntPair, desc);
    p.is_list = true;
    p.parse = [f, key, lo, hi](OverlayConfig& c, const std::string& v) {
        auto items = split_list(v);
        if (items.size() != 2) {
            throw ConfigError(ConfigErrc::InvalidValue, key + " expects 2 values, got " + std::to_string(items.size()));
        }
        std::array<int, 2> out;
        for (size_t i = 0; i < 2; ++i) out[i] = static_cast<int>(parse_int(items[i], lo, hi));
        c.*f = out;
    };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> {
        return std::to_string((c.*f)[0]) + "," + std::to_string((c.*f)[1]);
    };
    p.copy_from = copier(f);
    return p;
}

ParamSpec int_list_param(const std::string& key, const std::string& section, const std::string& desc,
                         Field<std::vector<int>> f, long long lo, long long hi) {
    auto p = make(key, section, ParamKind::IntList, desc);
    p.is_list = true;
    p.parse = [f, key, lo, hi](OverlayConfig& c, const std::string& v) {
        auto items = split_list(v);
        if (items.empty()) throw ConfigError(ConfigErrc::InvalidValue, key + " expects at least one value");
        std::vector<int> out;
        for (const auto& item : items) out.push_back(static_cast<int>(parse_int(item, lo, hi)));
        c.*f = std::move(out);
    };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> {
        std::vector<std::string> items;
        for (int n : c.*f) items.push_back(std::to_string(n));
        return join_list(items);
    };
    p.copy_from = copier(f);
    return p;
}

ParamSpec string_list_param(const std::string& key, const std::string& section, const std::string& desc,
                            Field<std::vector<std::string>> f) {
    auto p = make(key, section, ParamKind::StringList, desc);
    p.is_list = true;
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = split_list(v); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return join_list(c.*f); };
    p.copy_from = copier(f);
    return p;
}

ParamSpec keybind_param(const std::string& key, const std::string& desc, Field<Keybind> f) {
    auto p = make(key, "Keybinds", ParamKind::Keybind, desc);
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = parse_keybind(v); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return format_keybind(c.*f); };
    p.copy_from = copier(f);
    return p;
}

template <typename Dur>
ParamSpec duration_param(const std::string& key, const std::string& section, const std::string& desc,
                         Field<Dur> f) {
    auto p = make(key, section, ParamKind::Duration, desc);
    p.parse = [f](OverlayConfig& c, const std::string& v) { c.*f = Dur(parse_int(v, 0, 1LL << 40)); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return std::to_string((c.*f).count()); };
    p.copy_from = copier(f);
    return p;
}

template <typename E>
ParamSpec enum_param(const std::string& key, const std::string& section, const std::string& desc,
                     Field<E> f, E (*parse_fn)(const std::string&), const std::vector<std::string>& choices) {
    auto p = make(key, section, ParamKind::Enum, desc);
    p.choices = &choices;
    p.parse = [f, parse_fn](OverlayConfig& c, const std::string& v) { c.*f = parse_fn(v); };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> { return to_string(c.*f); };
    p.copy_from = copier(f);
    return p;
}

ParamSpec vsync_param() {
    auto p = make("vsync", "Performance", ParamKind::Enum,
                  "Vulkan vsync mode: 0 adaptive, 1 off, 2 mailbox, 3 on");
    p.choices = &vsync_names();
    Field<std::optional<VSync>> f = &OverlayConfig::vsync;
    p.parse = [f](OverlayConfig& c, const std::string& v) {
        if (trim(v).empty()) { (c.*f).reset(); return; }
        c.*f = parse_vsync(v);
    };
    p.format = [f](const OverlayConfig& c) -> std::optional<std::string> {
        if (!(c.*f)) return std::nullopt;
        return to_string(*(c.*f));
    };
    p.copy_from = copier(f);
    return p;
}

std::vector<ParamSpec> build_table() {
    using C = OverlayConfig;
    const bool ord = true;
    std::vector<ParamSpec> t;

    // Performance
    t.push_back(int_list_param("fps_limit", "Performance", "FPS limits cycled by toggle_fps_limit; 0 is unlimited", &C::fps_limit, 0, 10000));
    t.push_back(enum_param("fps_limit_method", "Performance", "Limiter timing: early (smoother) or late (lower latency)",
                           &C::fps_limit_method, &parse_fps_limit_method, fps_limit_method_names()));
    t.push_back(vsync_param());
    t.push_back(optional_int_param("gl_vsync", "Performance", "OpenGL swap interval; -1 adaptive, 0 off, n every n-th refresh", &C::gl_vsync, -1, 65535));
    t.push_back(optional_int_param("picmip", "Performance", "Mip-map LoD bias [-16, 16]", &C::picmip, -128, 127));
    t.push_back(optional_int_param("af", "Performance", "Anisotropic filtering level [0, 16]", &C::af, 0, 255));
    t.push_back(bool_param("bicubic", "Performance", "Force bicubic filtering", &C::bicubic));
    t.push_back(bool_param("trilinear", "Performance", "Force trilinear filtering", &C::trilinear));
    t.push_back(bool_param("retro", "Performance", "Disable linear texture filtering", &C::retro));

    // Core visual
    t.push_back(bool_param("legacy_layout", "Core Visual", "Classic layout; 0 disables default elements and draws in file order", &C::legacy_layout));
    t.push_back(enum_param("preset", "Core Visual", "Built-in preset: -1 none, 0 off, 1 fps only, 2 horizontal, 3 extended, 4 detailed",
                           &C::preset, &parse_hud_preset, hud_preset_names()));
    t.push_back(bool_param("histogram", "Core Visual", "Frametime histogram instead of a line graph", &C::histogram));
    t.push_back(string_param("custom_text_center", "Core Visual", "Centered text line", &C::custom_text_center, ParamKind::String, ord, true));
    t.push_back(bool_param("time", "Core Visual", "Show system time", &C::time, ord));
    t.push_back(string_param("time_format", "Core Visual", "strftime format for time", &C::time_format));
    t.push_back(bool_param("version", "Core Visual", "Show MangoHud version", &C::version, ord));

    // GPU
    t.push_back(bool_param("gpu_stats", "GPU", "GPU load", &C::gpu_stats, ord));
    t.push_back(bool_param("gpu_temp", "GPU", "GPU temperature", &C::gpu_temp));
    t.push_back(bool_param("gpu_junction_temp", "GPU", "GPU junction temperature", &C::gpu_junction_temp));
    t.push_back(bool_param("gpu_core_clock", "GPU", "GPU core clock", &C::gpu_core_clock));
    t.push_back(bool_param("gpu_mem_temp", "GPU", "GPU memory temperature (needs vram)", &C::gpu_mem_temp));
    t.push_back(bool_param("gpu_mem_clock", "GPU", "GPU memory clock (needs vram)", &C::gpu_mem_clock));
    t.push_back(bool_param("gpu_power", "GPU", "GPU power draw", &C::gpu_power));
    t.push_back(string_param("gpu_text", "GPU", "Label for the GPU line", &C::gpu_text));
    t.push_back(bool_param("gpu_load_change", "GPU", "Color GPU load by gpu_load_value thresholds", &C::gpu_load_change));
    t.push_back(int_pair_param("gpu_load_value", "GPU", "Medium and high GPU load thresholds", &C::gpu_load_value, 0, 255));
    t.push_back(color_list_param("gpu_load_color", "GPU", "Colors for low, medium and high GPU load", &C::gpu_load_color));

    // CPU
    t.push_back(bool_param("cpu_stats", "CPU", "CPU load", &C::cpu_stats, ord));
    t.push_back(bool_param("cpu_temp", "CPU", "CPU temperature", &C::cpu_temp));
    t.push_back(bool_param("cpu_power", "CPU", "CPU power draw", &C::cpu_power));
    t.push_back(string_param("cpu_text", "CPU", "Label for the CPU line", &C::cpu_text));
    t.push_back(bool_param("cpu_mhz", "CPU", "CPU frequency", &C::cpu_mhz));
    t.push_back(bool_param("cpu_load_change", "CPU", "Color CPU load by cpu_load_value thresholds", &C::cpu_load_change));
    t.push_back(int_pair_param("cpu_load_value", "CPU", "Medium and high CPU load thresholds", &C::cpu_load_value, 0, 255));
    t.push_back(color_list_param("cpu_load_color", "CPU", "Colors for low, medium and high CPU load", &C::cpu_load_color));
    t.push_back(bool_param("core_load", "CPU", "Per-core load", &C::core_load, ord));
    t.push_back(bool_param("core_load_change", "CPU", "Color per-core load", &C::core_load_change));

    // IO
    t.push_back(bool_param("io_read", "IO", "Application disk reads", &C::io_read, ord));
    t.push_back(bool_param("io_write", "IO", "Application disk writes", &C::io_write, ord));

    // Memory
    t.push_back(bool_param("vram", "Memory", "VRAM usage", &C::vram, ord));
    t.push_back(bool_param("ram", "Memory", "System RAM usage", &C::ram, ord));
    t.push_back(bool_param("swap", "Memory", "Swap usage", &C::swap, ord));
    t.push_back(bool_param("procmem", "Memory", "Process resident memory", &C::procmem, ord));
    t.push_back(bool_param("procmem_shared", "Memory", "Process shared memory", &C::procmem_shared));
    t.push_back(bool_param("procmem_virt", "Memory", "Process virtual memory", &C::procmem_virt));

    // Battery
    t.push_back(bool_param("battery", "Battery", "Laptop battery level", &C::battery, ord));
    t.push_back(bool_param("battery_icon", "Battery", "Battery icon instead of percent", &C::battery_icon));
    t.push_back(bool_param("gamepad_battery", "Battery", "Gamepad battery levels", &C::gamepad_battery, ord));
    t.push_back(bool_param("gamepad_battery_icon", "Battery", "Gamepad battery icon", &C::gamepad_battery_icon));

    // FPS
    t.push_back(bool_param("fps", "FPS", "Frames per second", &C::fps, ord));
    t.push_back(duration_param("fps_sampling_period", "FPS", "FPS sampling interval in milliseconds", &C::fps_sampling_period));
    t.push_back(bool_param("fps_color_change", "FPS", "Color FPS by fps_value thresholds", &C::fps_color_change));
    t.push_back(int_pair_param("fps_value", "FPS", "Low and medium FPS thresholds", &C::fps_value, 0, 10000));
    t.push_back(color_list_param("fps_color", "FPS", "Colors for low, medium and high FPS", &C::fps_color));
    t.push_back(bool_param("frametime", "FPS", "Frametime next to FPS", &C::frametime));
    t.push_back(bool_param("frame_timing", "FPS", "Frametime graph", &C::frame_timing, ord));
    t.push_back(bool_param("frame_count", "FPS", "Frame counter", &C::frame_count, ord));
    t.push_back(bool_param("show_fps_limit", "FPS", "Current FPS limit", &C::show_fps_limit, ord));

    // Misc
    t.push_back(bool_param("throttling_status", "Misc", "GPU throttling status", &C::throttling_status, ord));
    t.push_back(bool_param("engine_version", "Misc", "Graphics API and driver version", &C::engine_version, ord));
    t.push_back(bool_param("gpu_name", "Misc", "GPU name", &C::gpu_name, ord));
    t.push_back(bool_param("vulkan_driver", "Misc", "Vulkan driver name", &C::vulkan_driver, ord));
    t.push_back(bool_param("wine", "Misc", "Wine/Proton version", &C::wine, ord));
    t.push_back(bool_param("exec_name", "Misc", "Executable name", &C::exec_name, ord));
    t.push_back(bool_param("arch", "Misc", "Application architecture", &C::arch, ord));
    t.push_back(bool_param("gamemode", "Misc", "Feral gamemode status", &C::gamemode, ord));
    t.push_back(bool_param("vkbasalt", "Misc", "vkBasalt status", &C::vkbasalt, ord));
    t.push_back(bool_param("resolution", "Misc", "Render resolution", &C::resolution, ord));
    t.push_back(string_param("custom_text", "Misc", "Free text line", &C::custom_text, ParamKind::String, ord, true));
    t.push_back(string_param("exec", "Misc", "Shell command whose output is shown", &C::exec, ParamKind::String, ord, true));

    // Media
    t.push_back(bool_param("media_player", "Media", "Now-playing information", &C::media_player, ord));
    t.push_back(string_param("media_player_name", "Media", "MPRIS player name", &C::media_player_name));
    t.push_back(string_param("media_player_format", "Media", "Fields separated by ';'", &C::media_player_format));

    // Font
    t.push_back(float_param("font_size", "Font", "Font size", &C::font_size));
    t.push_back(float_param("font_scale", "Font", "Global font scale", &C::font_scale));
    t.push_back(float_param("font_size_text", "Font", "Font size for text lines", &C::font_size_text));
    t.push_back(float_param("font_scale_media_player", "Font", "Media player font scale", &C::font_scale_media_player));
    t.push_back(bool_param("no_small_font", "Font", "Use the primary font size everywhere", &C::no_small_font));
    t.push_back(string_param("font_file", "Font", "TTF font file", &C::font_file, ParamKind::Path));
    t.push_back(string_param("font_file_text", "Font", "TTF font file for text lines", &C::font_file_text, ParamKind::Path));
    t.push_back(string_list_param("font_glyph_ranges", "Font", "Extra glyph ranges (korean, chinese, japanese, ...)", &C::font_glyph_ranges));
    t.push_back(bool_param("text_outline", "Font", "Outline text", &C::text_outline));
    t.push_back(float_param("text_outline_thickness", "Font", "Outline thickness", &C::text_outline_thickness));

    // Appearance
    t.push_back(enum_param("position", "Appearance", "HUD anchor", &C::position, &parse_hud_position, hud_position_names()));
    t.push_back(float_param("round_corners", "Appearance", "Corner radius", &C::round_corners));
    t.push_back(bool_param("hud_no_margin", "Appearance", "No margin around the HUD", &C::hud_no_margin));
    t.push_back(bool_param("hud_compact", "Appearance", "Compact HUD", &C::hud_compact));
    t.push_back(bool_param("horizontal", "Appearance", "Horizontal HUD", &C::horizontal));
    t.push_back(bool_param("horizontal_stretch", "Appearance", "Stretch horizontal HUD background to screen width", &C::horizontal_stretch));
    t.push_back(bool_param("no_display", "Appearance", "Start hidden", &C::no_display));
    t.push_back(float_param("offset_x", "Appearance", "Horizontal offset", &C::offset_x));
    t.push_back(float_param("offset_y", "Appearance", "Vertical offset", &C::offset_y));
    t.push_back(float_param("width", "Appearance", "Fixed width; 0 is automatic", &C::width));
    t.push_back(float_param("height", "Appearance", "Fixed height", &C::height));
    t.push_back(int_param("table_columns", "Appearance", "Number of table columns", &C::table_columns, 0, 255));
    t.push_back(float_param("cellpadding_y", "Appearance", "Vertical cell padding", &C::cellpadding_y));
    t.push_back(float_param("background_alpha", "Appearance", "Background opacity [0, 1]", &C::background_alpha));
    t.push_back(float_param("alpha", "Appearance", "Overall opacity [0, 1]", &C::alpha));

    // FCAT
    t.push_back(bool_param("fcat", "FCAT", "FCAT overlay", &C::fcat, ord));
    t.push_back(int_param("fcat_overlay_width", "FCAT", "FCAT bar width", &C::fcat_overlay_width, 0, 65535));
    t.push_back(enum_param("fcat_screen_edge", "FCAT", "FCAT edge: 0 left, 1 bottom, 2 right, 3 top",
                           &C::fcat_screen_edge, &parse_fcat_edge, fcat_edge_names()));

    // Colors
    t.push_back(color_param("text_color", "Text", &C::text_color));
    t.push_back(color_param("gpu_color", "GPU label", &C::gpu_color));
    t.push_back(color_param("cpu_color", "CPU label", &C::cpu_color));
    t.push_back(color_param("vram_color", "VRAM label", &C::vram_color));
    t.push_back(color_param("ram_color", "RAM label", &C::ram_color));
    t.push_back(color_param("engine_color", "Engine label", &C::engine_color));
    t.push_back(color_param("io_color", "IO label", &C::io_color));
    t.push_back(color_param("frametime_color", "Frametime graph", &C::frametime_color));
    t.push_back(color_param("background_color", "Background", &C::background_color));
    t.push_back(color_param("media_player_color", "Media player text", &C::media_player_color));
    t.push_back(color_param("wine_color", "Wine label", &C::wine_color));
    t.push_back(color_param("battery_color", "Battery label", &C::battery_color));
    t.push_back(color_param("text_outline_color", "Text outline", &C::text_outline_color));

    // Other
    t.push_back(string_param("pci_dev", "Other", "PCI address of the GPU to monitor", &C::pci_dev));
    t.push_back(string_list_param("blacklist", "Other", "Process names MangoHud ignores", &C::blacklist));
    t.push_back(string_param("control", "Other", "Control socket name", &C::control));

    // OpenGL
    t.push_back(optional_int_param("gl_bind_framebuffer", "OpenGL", "Framebuffer to bind before drawing", &C::gl_bind_framebuffer, 0, 65535));

    // Keybinds
    t.push_back(keybind_param("toggle_hud", "Show or hide the HUD", &C::toggle_hud));
    t.push_back(keybind_param("toggle_hud_position", "Cycle HUD position", &C::toggle_hud_position));
    t.push_back(keybind_param("toggle_fps_limit", "Cycle fps_limit entries", &C::toggle_fps_limit));
    t.push_back(keybind_param("toggle_logging", "Start or stop logging", &C::toggle_logging));
    t.push_back(keybind_param("reload_cfg", "Reload the config file", &C::reload_cfg));
    t.push_back(keybind_param("upload_log", "Upload the last log", &C::upload_log));

    // Logging
    t.push_back(bool_param("autostart_log", "Logging", "Start logging on launch", &C::autostart_log));
    t.push_back(duration_param("log_duration", "Logging", "Log length in seconds; 0 is unlimited", &C::log_duration));
    t.push_back(duration_param("log_interval", "Logging", "Log sampling interval in milliseconds", &C::log_interval));
    t.push_back(string_param("output_folder", "Logging", "Directory for log files", &C::output_folder, ParamKind::Path));
    t.push_back(bool_param("permit_upload", "Logging", "Allow uploading logs", &C::permit_upload));
    t.push_back(string_param("benchmark_percentiles", "Logging", "Percentiles joined with '+', e.g. 97+AVG", &C::benchmark_percentiles));
    return t;
}

const ParamSpec& require_param(const std::string& key) {
    const ParamSpec* spec = find_param(key);
    if (!spec) throw ConfigError(ConfigErrc::UnknownKey, "Unknown parameter '" + key + "'");
    return *spec;
}

} // namespace

const std::vector<ParamSpec>& all_params() {
    static const std::vector<ParamSpec> table = build_table();
    return table;
}

const ParamSpec* find_param(const std::string& key) {
    static const std::unordered_map<std::string, size_t> index = [] {
        std::unordered_map<std::string, size_t> m;
        const auto& t = all_params();
        for (size_t i = 0; i < t.size(); ++i) m.emplace(t[i].key, i);
        return m;
    }();
    auto it = index.find(key);
    if (it == index.end()) return nullptr;
    return &all_params()[it->second];
}

const std::vector<std::string>& sections() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& p : all_params()) {
            if (std::find(out.begin(), out.end(), p.section) == out.end()) out.push_back(p.section);
        }
        return out;
    }();
    return names;
}

std::vector<const ParamSpec*> params_in_section(const std::string& section) {
    std::vector<const ParamSpec*> out;
    for (const auto& p : all_params()) {
        if (p.section == section) out.push_back(&p);
    }
    return out;
}

std::optional<std::string> get_value(const OverlayConfig& config, const std::string& key) {
    return require_param(key).format(config);
}

void set_value(OverlayConfig& config, const std::string& key, const std::string& value) {
    const ParamSpec& spec = require_param(key);
    try {
        spec.parse(config, value);
    } catch (const ConfigError& e) {
        throw ConfigError(e.code(), key + ": " + e.what());
    }
    config.explicit_keys.insert(key);
}

void reset_value(OverlayConfig& config, const std::string& key) {
    const ParamSpec& spec = require_param(key);
    config.explicit_keys.erase(key);
    if (key == "legacy_layout") {
        config.legacy_layout = true;
        return;
    }
    spec.copy_from(config, default_config(config.legacy_layout));
}

bool is_default(const OverlayConfig& config, const std::string& key) {
    const ParamSpec& spec = require_param(key);
    if (key == "legacy_layout") return config.legacy_layout;
    return spec.format(config) == spec.format(default_config(config.legacy_layout));
}

std::vector<std::string> changed_keys(const OverlayConfig& config) {
    const OverlayConfig defaults = default_config(config.legacy_layout);
    std::vector<std::string> out;
    for (const auto& p : all_params()) {
        if (p.key == "legacy_layout") {
            if (!config.legacy_layout) out.push_back(p.key);
            continue;
        }
        if (p.format(config) != p.format(defaults)) out.push_back(p.key);
    }
    return out;
}

bool same_values(const OverlayConfig& a, const OverlayConfig& b) {
    for (const auto& p : all_params()) {
        if (p.format(a) != p.format(b)) return false;
    }
    return a.layout == b.layout && a.extras == b.extras;
}

} // namespace mo
