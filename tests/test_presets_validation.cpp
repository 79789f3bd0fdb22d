#include <gtest/gtest.h>

#include <algorithm>

#include "hud/config_parser.hpp"
#include "hud/param_registry.hpp"
#include "hud/presets.hpp"
#include "hud/validation.hpp"

using namespace mo;

namespace {

bool has_issue(const std::vector<ValidationIssue>& issues, const std::string& key, Severity severity) {
  return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) {
    return i.key == key && i.severity == severity;
  });
}

bool in_layout(const OverlayConfig& cfg, const std::string& key) {
  return std::any_of(cfg.layout.begin(), cfg.layout.end(),
                     [&](const LayoutEntry& e) { return e.key == key; });
}

}  // namespace

TEST(Presets, FpsOnly) {
  OverlayConfig cfg = apply_preset(default_config(), HudPreset::FpsOnly);
  EXPECT_FALSE(cfg.legacy_layout);
  EXPECT_TRUE(cfg.fps);
  EXPECT_FALSE(cfg.gpu_stats);
  EXPECT_FALSE(cfg.cpu_stats);
  EXPECT_FALSE(cfg.frametime);
  EXPECT_EQ(cfg.preset, HudPreset::Default);
  EXPECT_TRUE(in_layout(cfg, "fps"));
}

TEST(Presets, UserValuesWin) {
  OverlayConfig mine = default_config();
  set_value(mine, "font_size", "30");
  set_value(mine, "position", "bottom-right");
  OverlayConfig cfg = apply_preset(mine, HudPreset::Detailed);
  EXPECT_DOUBLE_EQ(cfg.font_size, 30.0);
  EXPECT_EQ(cfg.position, HudPosition::BottomRight);
  EXPECT_TRUE(cfg.gpu_name);
  EXPECT_TRUE(cfg.vkbasalt);
}

TEST(Presets, ExplicitDefaultValuesWin) {
  auto parsed = mo::parse_config("gpu_stats=1\ncpu_stats=1\n");
  OverlayConfig cfg = apply_preset(parsed.config, HudPreset::FpsOnly);
  EXPECT_FALSE(cfg.legacy_layout);
  EXPECT_TRUE(cfg.gpu_stats);
  EXPECT_TRUE(cfg.cpu_stats);
  EXPECT_TRUE(cfg.fps);
  EXPECT_FALSE(cfg.frametime);

  // A value that was reset is no longer the user's and the preset applies
  OverlayConfig reset = parsed.config;
  reset_value(reset, "gpu_stats");
  EXPECT_FALSE(apply_preset(reset, HudPreset::FpsOnly).gpu_stats);
}

TEST(Presets, OffAndDefault) {
  EXPECT_TRUE(apply_preset(default_config(), HudPreset::Off).no_display);
  EXPECT_TRUE(preset_text(HudPreset::Default).empty());
  OverlayConfig mine = default_config();
  set_value(mine, "ram", "1");
  EXPECT_TRUE(same_values(apply_preset(mine, HudPreset::Default), mine));
  EXPECT_EQ(preset_title(HudPreset::Horizontal), "horizontal");
}

TEST(Validation, DefaultsAreClean) {
  auto issues = validate(default_config());
  EXPECT_TRUE(issues.empty());
  EXPECT_FALSE(has_errors(issues));
}

TEST(Validation, RangesAndOrdering) {
  OverlayConfig cfg = default_config();
  set_value(cfg, "fps_value", "60,30");
  set_value(cfg, "alpha", "1.5");
  set_value(cfg, "picmip", "20");
  auto issues = validate(cfg);
  EXPECT_TRUE(has_errors(issues));
  EXPECT_TRUE(has_issue(issues, "fps_value", Severity::Error));
  EXPECT_TRUE(has_issue(issues, "alpha", Severity::Error));
  EXPECT_TRUE(has_issue(issues, "picmip", Severity::Error));
}

TEST(Validation, DuplicateKeybinds) {
  OverlayConfig cfg = default_config();
  set_value(cfg, "reload_cfg", "Shift_R+F12");
  EXPECT_TRUE(has_issue(validate(cfg), "reload_cfg", Severity::Error));
}

TEST(Validation, DependenciesAreWarnings) {
  OverlayConfig cfg = default_config();
  set_value(cfg, "gpu_mem_clock", "1");
  set_value(cfg, "font_glyph_ranges", "klingon");
  set_value(cfg, "fps_limit", "60,60");
  auto issues = validate(cfg);
  EXPECT_FALSE(has_errors(issues));
  EXPECT_TRUE(has_issue(issues, "gpu_mem_clock", Severity::Warning));
  EXPECT_TRUE(has_issue(issues, "font_glyph_ranges", Severity::Warning));
  EXPECT_TRUE(has_issue(issues, "fps_limit", Severity::Warning));

  OverlayConfig empty_modern = default_config(false);
  EXPECT_TRUE(has_issue(validate(empty_modern), "legacy_layout", Severity::Warning));
}

TEST(Validation, LoadThresholdsBothInRange) {
  OverlayConfig cfg = default_config();
  cfg.gpu_load_value = {150, 90};
  cfg.cpu_load_value = {60, 101};
  auto issues = validate(cfg);
  auto gpu = std::count_if(issues.begin(), issues.end(),
                           [](const ValidationIssue& i) { return i.key == "gpu_load_value"; });
  EXPECT_EQ(gpu, 2);
  EXPECT_TRUE(has_issue(issues, "cpu_load_value", Severity::Error));
}

TEST(Validation, SizesAndCorners) {
  OverlayConfig cfg = default_config();
  cfg.round_corners = -2;
  cfg.table_columns = 0;
  cfg.fcat_overlay_width = 0;
  auto issues = validate(cfg);
  EXPECT_TRUE(has_issue(issues, "round_corners", Severity::Error));
  EXPECT_TRUE(has_issue(issues, "table_columns", Severity::Error));
  EXPECT_TRUE(has_issue(issues, "fcat_overlay_width", Severity::Error));
}

TEST(Validation, MissingFontFile) {
  OverlayConfig cfg = default_config();
  cfg.font_file = "/nonexistent/mangoverlay/font.ttf";
  auto issues = validate(cfg);
  EXPECT_TRUE(has_issue(issues, "font_file", Severity::Warning));
  EXPECT_FALSE(has_errors(issues));
}

TEST(Validation, OptionsWithoutTheirElementAreInfo) {
  OverlayConfig cfg = default_config();
  cfg.battery_icon = true;
  cfg.gamepad_battery_icon = true;
  cfg.media_player_name = "spotify";
  cfg.horizontal_stretch = false;
  auto issues = validate(cfg);
  EXPECT_FALSE(has_errors(issues));
  EXPECT_TRUE(has_issue(issues, "battery_icon", Severity::Info));
  EXPECT_TRUE(has_issue(issues, "gamepad_battery_icon", Severity::Info));
  EXPECT_TRUE(has_issue(issues, "media_player_name", Severity::Info));
  EXPECT_TRUE(has_issue(issues, "horizontal_stretch", Severity::Info));

  cfg.battery = true;
  cfg.gamepad_battery = true;
  cfg.media_player = true;
  cfg.horizontal = true;
  EXPECT_TRUE(validate(cfg).empty());
}
