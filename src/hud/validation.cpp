#include "hud/validation.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include "hud/keybind.hpp"
#include "hud/value_codec.hpp"
#include "mo_types.hpp"

namespace mo {

const std::vector<std::string>& known_glyph_ranges() {
    static const std::vector<std::string> names = {
        "korean", "chinese", "chinese_simplified", "japanese", "cyrillic",
        "thai", "vietnamese", "latin_ext_a", "latin_ext_b",
    };
    return names;
}

bool has_errors(const std::vector<ValidationIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(),
                       [](const ValidationIssue& i) { return i.severity == Severity::Error; });
}

namespace {

class Checker {
public:
    void error(const std::string& key, const std::string& msg) { issues_.push_back({Severity::Error, key, msg}); }
    void warning(const std::string& key, const std::string& msg) { issues_.push_back({Severity::Warning, key, msg}); }
    void info(const std::string& key, const std::string& msg) { issues_.push_back({Severity::Info, key, msg}); }

    void range(const std::string& key, double v, double lo, double hi) {
        if (v < lo || v > hi) {
            error(key, "value " + format_float(v) + " outside [" + format_float(lo) + ", " + format_float(hi) + "]");
        }
    }
    void positive(const std::string& key, double v) {
        if (v <= 0) error(key, "must be greater than 0");
    }
    void ascending(const std::string& key, const std::array<int, 2>& v) {
        if (v[0] > v[1]) error(key, "thresholds must be ascending, got " + std::to_string(v[0]) + "," + std::to_string(v[1]));
    }

    std::vector<ValidationIssue> take() { return std::move(issues_); }

private:
    std::vector<ValidationIssue> issues_;
};

} // namespace

std::vector<ValidationIssue> validate(const OverlayConfig& c) {
    Checker check;

    if (c.picmip) check.range("picmip", *c.picmip, -16, 16);
    if (c.af) check.range("af", *c.af, 0, 16);

    check.ascending("fps_value", c.fps_value);
    check.ascending("gpu_load_value", c.gpu_load_value);
    check.ascending("cpu_load_value", c.cpu_load_value);
    for (int v : c.gpu_load_value) check.range("gpu_load_value", v, 0, 100);
    for (int v : c.cpu_load_value) check.range("cpu_load_value", v, 0, 100);

    check.range("alpha", c.alpha, 0.0, 1.0);
    check.range("background_alpha", c.background_alpha, 0.0, 1.0);
    check.positive("font_size", c.font_size);
    check.positive("font_size_text", c.font_size_text);
    check.positive("font_scale", c.font_scale);
    check.positive("font_scale_media_player", c.font_scale_media_player);
    if (c.text_outline) check.positive("text_outline_thickness", c.text_outline_thickness);
    if (c.round_corners < 0) check.error("round_corners", "must not be negative");

    if (c.table_columns < 1) check.error("table_columns", "must be at least 1");
    if (c.fcat_overlay_width < 1) check.error("fcat_overlay_width", "must be at least 1");

    if (c.gpu_mem_clock && !c.vram) check.warning("gpu_mem_clock", "has no effect unless vram is enabled");
    if (c.gpu_mem_temp && !c.vram) check.warning("gpu_mem_temp", "has no effect unless vram is enabled");
    if (!c.horizontal_stretch && !c.horizontal) check.info("horizontal_stretch", "only applies when horizontal is enabled");
    if (c.battery_icon && !c.battery) check.info("battery_icon", "only applies when battery is enabled");
    if (c.gamepad_battery_icon && !c.gamepad_battery) check.info("gamepad_battery_icon", "only applies when gamepad_battery is enabled");
    if (c.media_player_name.size() && !c.media_player) check.info("media_player_name", "only applies when media_player is enabled");

    const auto& known = known_glyph_ranges();
    for (const auto& r : c.font_glyph_ranges) {
        if (std::find(known.begin(), known.end(), r) == known.end()) {
            check.warning("font_glyph_ranges", "unknown glyph range '" + r + "'");
        }
    }

    std::error_code ec;
    if (!c.font_file.empty() && !fs::exists(c.font_file, ec)) check.warning("font_file", "file not found: " + c.font_file);
    if (!c.font_file_text.empty() && !fs::exists(c.font_file_text, ec)) check.warning("font_file_text", "file not found: " + c.font_file_text);

    std::set<int> limits;
    for (int l : c.fps_limit) {
        if (!limits.insert(l).second) check.warning("fps_limit", "duplicate limit " + std::to_string(l));
    }

    const std::vector<std::pair<std::string, const Keybind*>> binds = {
        {"toggle_hud", &c.toggle_hud},           {"toggle_hud_position", &c.toggle_hud_position},
        {"toggle_fps_limit", &c.toggle_fps_limit}, {"toggle_logging", &c.toggle_logging},
        {"reload_cfg", &c.reload_cfg},           {"upload_log", &c.upload_log},
    };
    std::map<std::string, std::string> seen;
    for (const auto& b : binds) {
        const std::string text = format_keybind(*b.second);
        auto it = seen.find(text);
        if (it != seen.end()) check.error(b.first, "binding " + text + " is already used by " + it->second);
        else seen.emplace(text, b.first);
    }

    if (!c.legacy_layout && c.layout.empty()) {
        check.warning("legacy_layout", "legacy_layout is off but no HUD elements are enabled");
    }
    return check.take();
}

} // namespace mo
