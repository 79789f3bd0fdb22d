#include <gtest/gtest.h>

#include "hud/layout.hpp"
#include "hud/param_registry.hpp"
#include "mo_types.hpp"

using namespace mo;

namespace {

std::vector<std::string> keys_of(const OverlayConfig& cfg) {
  std::vector<std::string> out;
  for (const auto& e : cfg.layout) out.push_back(e.key);
  return out;
}

}  // namespace

TEST(Layout, SwitchingLegacyOffSeedsEnabledElements) {
  OverlayConfig cfg = default_config();
  assign_param(cfg, "legacy_layout", "0");
  EXPECT_FALSE(cfg.legacy_layout);
  EXPECT_EQ(keys_of(cfg), (std::vector<std::string>{"gpu_stats", "cpu_stats", "fps", "frame_timing"}));

  assign_param(cfg, "legacy_layout", "1");
  EXPECT_TRUE(cfg.layout.empty());
}

TEST(Layout, AssignMirrorsOrderableKeys) {
  OverlayConfig cfg = default_config(false);
  assign_param(cfg, "ram", "1");
  assign_param(cfg, "font_size", "30");
  ASSERT_EQ(cfg.layout.size(), 1u);
  EXPECT_EQ(cfg.layout[0], (LayoutEntry{"ram", "1"}));

  assign_param(cfg, "ram", "0");
  ASSERT_EQ(cfg.layout.size(), 1u);
  EXPECT_EQ(cfg.layout[0].value, "0");

  restore_param(cfg, "ram");
  EXPECT_TRUE(cfg.layout.empty());
}

TEST(Layout, LegacyModeDoesNotTrackOrder) {
  OverlayConfig cfg = default_config();
  assign_param(cfg, "ram", "1");
  EXPECT_TRUE(cfg.layout.empty());
  EXPECT_TRUE(cfg.ram);
}

TEST(Layout, RepeatableEntries) {
  OverlayConfig cfg = default_config(false);
  layout_add(cfg, "custom_text", "one");
  layout_add(cfg, "fps", "1");
  layout_add(cfg, "custom_text", "two");
  EXPECT_EQ(cfg.custom_text, "two");

  // Updating a repeatable key edits its last entry
  assign_param(cfg, "custom_text", "three");
  EXPECT_EQ(cfg.layout[2].value, "three");
  EXPECT_EQ(cfg.layout[0].value, "one");

  // Removing the last entry falls back to the remaining one
  layout_remove(cfg, 2);
  EXPECT_EQ(cfg.custom_text, "one");
  layout_remove(cfg, 0);
  EXPECT_EQ(cfg.custom_text, "");
  EXPECT_EQ(keys_of(cfg), (std::vector<std::string>{"fps"}));
}

TEST(Layout, MoveClampsToBounds) {
  OverlayConfig cfg = default_config(false);
  layout_add(cfg, "fps", "1");
  layout_add(cfg, "ram", "1");
  layout_add(cfg, "vram", "1");
  EXPECT_EQ(layout_move(cfg, 0, 10), 2u);
  EXPECT_EQ(keys_of(cfg), (std::vector<std::string>{"ram", "vram", "fps"}));
  EXPECT_EQ(layout_move(cfg, 1, -5), 0u);
  EXPECT_EQ(keys_of(cfg), (std::vector<std::string>{"vram", "ram", "fps"}));
  EXPECT_THROW(layout_move(cfg, 3, 1), ConfigError);
  EXPECT_THROW(layout_remove(cfg, 3), ConfigError);
}

TEST(Layout, OnlyHudElementsCanBePlaced) {
  OverlayConfig cfg = default_config(false);
  EXPECT_THROW(layout_add(cfg, "font_size", "30"), ConfigError);
  EXPECT_THROW(layout_add(cfg, "fps", "maybe"), ConfigError);
  EXPECT_TRUE(cfg.layout.empty());
  EXPECT_TRUE(is_orderable("gpu_stats"));
  EXPECT_FALSE(is_orderable("gpu_temp"));
  EXPECT_TRUE(is_repeatable("exec"));
}

TEST(Layout, RemovingOnlyEntryRestoresDefault) {
  OverlayConfig cfg = default_config(false);
  layout_add(cfg, "ram", "1");
  layout_add(cfg, "fps", "1");
  ASSERT_TRUE(cfg.ram);
  layout_remove(cfg, 0);
  EXPECT_FALSE(cfg.ram);
  EXPECT_TRUE(is_default(cfg, "ram"));
  EXPECT_EQ(keys_of(cfg), (std::vector<std::string>{"fps"}));
}

TEST(Layout, UnknownKeyIsReportedAsSuch) {
  OverlayConfig cfg = default_config(false);
  try {
    layout_add(cfg, "no_such_element", "1");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.code(), ConfigErrc::UnknownKey);
  }
}
