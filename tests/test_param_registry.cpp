#include <gtest/gtest.h>

#include <set>

#include "hud/param_registry.hpp"
#include "mo_types.hpp"

using namespace mo;

TEST(ParamRegistry, KeysAreUnique) {
  std::set<std::string> keys;
  for (const auto& p : all_params()) {
    EXPECT_TRUE(keys.insert(p.key).second) << "duplicate key " << p.key;
    EXPECT_TRUE(p.parse && p.format && p.copy_from) << p.key;
  }
  EXPECT_EQ(sections().front(), "Performance");
  EXPECT_EQ(params_in_section("Keybinds").size(), 6u);
}

TEST(ParamRegistry, LookupByKey) {
  const ParamSpec* spec = find_param("fps_limit");
  ASSERT_NE(spec, nullptr);
  EXPECT_EQ(spec->kind, ParamKind::IntList);
  EXPECT_TRUE(spec->is_list);
  EXPECT_EQ(find_param("not_a_key"), nullptr);
}

TEST(ParamRegistry, OptionalValues) {
  OverlayConfig cfg = default_config();
  EXPECT_FALSE(get_value(cfg, "vsync").has_value());
  set_value(cfg, "vsync", "3");
  EXPECT_EQ(get_value(cfg, "vsync"), std::optional<std::string>("3"));
  set_value(cfg, "vsync", "");
  EXPECT_FALSE(cfg.vsync.has_value());
}

TEST(ParamRegistry, BadValueLeavesFieldUntouched) {
  OverlayConfig cfg = default_config();
  set_value(cfg, "fps_limit", "60,144");
  try {
    set_value(cfg, "fps_limit", "60,fast");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.code(), ConfigErrc::InvalidValue);
    EXPECT_NE(std::string(e.what()).find("fps_limit"), std::string::npos);
  }
  EXPECT_EQ(cfg.fps_limit, (std::vector<int>{60, 144}));
}

TEST(ParamRegistry, UnknownKeyThrows) {
  OverlayConfig cfg = default_config();
  try {
    set_value(cfg, "not_a_key", "1");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.code(), ConfigErrc::UnknownKey);
  }
  EXPECT_THROW(get_value(cfg, "not_a_key"), ConfigError);
}

TEST(ParamRegistry, DefaultsFollowLegacyLayout) {
  OverlayConfig modern = default_config(false);
  EXPECT_FALSE(modern.gpu_stats);
  EXPECT_EQ(changed_keys(modern), (std::vector<std::string>{"legacy_layout"}));
  EXPECT_FALSE(is_default(modern, "legacy_layout"));

  set_value(modern, "gpu_stats", "1");
  EXPECT_FALSE(is_default(modern, "gpu_stats"));
  reset_value(modern, "gpu_stats");
  EXPECT_EQ(get_value(modern, "gpu_stats"), std::optional<std::string>("0"));

  EXPECT_TRUE(changed_keys(default_config()).empty());
}

TEST(ParamRegistry, FormatsMatchFileSpelling) {
  OverlayConfig cfg = default_config();
  EXPECT_EQ(get_value(cfg, "position"), std::optional<std::string>("top-left"));
  EXPECT_EQ(get_value(cfg, "fps_color"), std::optional<std::string>("B22222,FDFD09,39F900"));
  EXPECT_EQ(get_value(cfg, "toggle_hud"), std::optional<std::string>("Shift_R+F12"));
  EXPECT_EQ(get_value(cfg, "fps_sampling_period"), std::optional<std::string>("500"));
  EXPECT_EQ(get_value(cfg, "height"), std::optional<std::string>("140"));
}
