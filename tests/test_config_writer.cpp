#include <gtest/gtest.h>

#include "hud/config_parser.hpp"
#include "hud/config_writer.hpp"
#include "hud/param_registry.hpp"
#include "test_util.hpp"

using namespace mo;

namespace {

WriteOptions bare(WriteMode mode = WriteMode::Minimal) {
  WriteOptions opts;
  opts.mode = mode;
  opts.header = false;
  return opts;
}

}  // namespace

TEST(ConfigWriter, MinimalDefaultsAreEmpty) {
  EXPECT_EQ(write_config(default_config(), bare()), "");
  EXPECT_EQ(write_config(default_config(false), bare()), "legacy_layout=0\n");
}

TEST(ConfigWriter, MinimalWritesChangedKeysInTableOrder) {
  OverlayConfig cfg = default_config();
  set_value(cfg, "gpu_color", "ff0000");
  set_value(cfg, "fps_limit", "60,144");
  set_value(cfg, "font_size", "30");
  EXPECT_EQ(write_config(cfg, bare()), "fps_limit=60,144\nfont_size=30\ngpu_color=FF0000\n");
}

TEST(ConfigWriter, FullWritesSectionsAndEveryValue) {
  std::string text = write_config(default_config(), bare(WriteMode::Full));
  EXPECT_EQ(text.rfind("### Performance\nfps_limit=0\n", 0), 0u);
  EXPECT_NE(text.find("### Keybinds\n"), std::string::npos);
  EXPECT_NE(text.find("height=140\n"), std::string::npos);
  EXPECT_NE(text.find("toggle_hud=Shift_R+F12\n"), std::string::npos);
  // Unset optionals are left out
  EXPECT_EQ(text.find("vsync="), std::string::npos);
}

TEST(ConfigWriter, HeaderNamesTheMode) {
  WriteOptions opts;
  std::string text = write_config(default_config(), opts);
  EXPECT_EQ(text.rfind("### MangoHud configuration", 0), 0u);
  EXPECT_NE(text.find("MangoHud defaults"), std::string::npos);
}

TEST(ConfigWriter, LayoutIsWrittenInDrawOrder) {
  const std::string source =
      "legacy_layout=0\n"
      "fps=1\n"
      "custom_text=Hi\n"
      "gpu_stats=1\n"
      "custom_text=Bye\n"
      "font_size=30\n";
  auto parsed = parse_config(source);
  EXPECT_EQ(write_config(parsed.config, bare()), source);
}

TEST(ConfigWriter, ExtrasAreWrittenLast) {
  auto parsed = parse_config("mystery=42\nram\nnew_flag\n");
  EXPECT_EQ(write_config(parsed.config, bare()), "ram=1\nmystery=42\nnew_flag\n");
}

TEST(ConfigWriter, RoundTripKeepsEveryValue) {
  auto parsed = parse_config(
      "legacy_layout=0\n"
      "time\n"
      "gpu_stats\n"
      "gpu_load_change\n"
      "gpu_load_color=00FF00,FFFF00,FF0000\n"
      "vsync=2\n"
      "toggle_hud=Control_R+Home\n"
      "font_glyph_ranges=korean,thai\n"
      "offset_x=12.5\n"
      "custom_text=one\n"
      "custom_text=two\n"
      "mystery=x\n");
  ASSERT_TRUE(parsed.diagnostics.size() == 1u);  // the unknown key
  for (WriteMode mode : {WriteMode::Minimal, WriteMode::Full}) {
    auto again = parse_config(write_config(parsed.config, bare(mode)));
    EXPECT_TRUE(same_values(parsed.config, again.config)) << to_string(mode);
  }
}

TEST(ConfigWriter, EnvString) {
  OverlayConfig cfg = default_config();
  set_value(cfg, "fps_limit", "60,144");
  set_value(cfg, "gpu_temp", "1");
  set_value(cfg, "frametime", "0");
  EXPECT_EQ(to_env_string(cfg), "fps_limit=60+144,gpu_temp,frametime=0");

  auto back = parse_env_config(to_env_string(cfg));
  EXPECT_TRUE(same_values(cfg, back.config));
}

TEST(ConfigWriter, FileWithBackup) {
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "nested" / "MangoHud.conf";
  OverlayConfig cfg = default_config();
  set_value(cfg, "ram", "1");
  write_config_file(cfg, path, bare());
  EXPECT_EQ(mo_test::read_file(path), "ram=1\n");

  set_value(cfg, "vram", "1");
  WriteOptions opts = bare();
  opts.backup = true;
  write_config_file(cfg, path, opts);
  EXPECT_EQ(mo_test::read_file(path), "vram=1\nram=1\n");
  fs::path backup = path;
  backup += ".bak";
  EXPECT_EQ(mo_test::read_file(backup), "ram=1\n");
}

TEST(ConfigWriter, WriteMode) {
  EXPECT_EQ(parse_write_mode("FULL"), WriteMode::Full);
  EXPECT_EQ(parse_write_mode("minimal"), WriteMode::Minimal);
  EXPECT_THROW(parse_write_mode("compact"), ConfigError);
}
