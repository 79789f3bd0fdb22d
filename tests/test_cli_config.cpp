#include <gtest/gtest.h>

#include "cli_config.hpp"
#include "cli_history.hpp"
#include "test_util.hpp"

using mo::CliConfig;
using mo::CliHistory;

TEST(CliConfig, YamlRoundTrip) {
  auto dir = mo_test::scratch_dir();
  const std::string path = (dir / "settings.yaml").string();
  CliConfig out;
  out.history_size = 50;
  out.write_mode = "full";
  out.backup_on_save = false;
  out.default_app = "game";
  out.show_defaults = true;
  out.default_export_path = "exported.json";
  out.exit_prompt_save = false;
  ASSERT_TRUE(mo::write_config_to_file(out, path));

  CliConfig in;
  mo::load_or_create_config(path, in);
  EXPECT_EQ(in.history_size, 50);
  EXPECT_EQ(in.write_mode, "full");
  EXPECT_FALSE(in.backup_on_save);
  EXPECT_EQ(in.default_app, "game");
  EXPECT_TRUE(in.show_defaults);
  EXPECT_EQ(in.default_export_path, "exported.json");
  EXPECT_FALSE(in.exit_prompt_save);
  EXPECT_FALSE(in.loaded_config_path.empty());

  auto opts = mo::to_write_options(in);
  EXPECT_EQ(opts.mode, mo::WriteMode::Full);
  EXPECT_FALSE(opts.backup);
}

TEST(CliConfig, BadValuesFallBack) {
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "settings.yaml";
  mo_test::write_file(path, "write_mode: compact\nhistory_size: 10\n");
  CliConfig cfg;
  mo::load_or_create_config(path.string(), cfg);
  EXPECT_EQ(cfg.write_mode, "minimal");
  EXPECT_EQ(cfg.history_size, 10);

  mo_test::write_file(path, "history_size: [unterminated\n");
  CliConfig broken;
  mo::load_or_create_config(path.string(), broken);
  EXPECT_EQ(broken.history_size, 1000);
}

TEST(CliConfig, MissingCustomPathIsNotCreated) {
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "absent.yaml";
  CliConfig cfg;
  mo::load_or_create_config(path.string(), cfg);
  EXPECT_FALSE(mo_test::fs::exists(path));
  EXPECT_TRUE(cfg.loaded_config_path.empty());
  EXPECT_EQ(mo::to_write_options(cfg).mode, mo::WriteMode::Minimal);
}

TEST(CliConfig, LoadingKeepsStdoutClean) {
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "settings.yaml";
  mo_test::write_file(path, "history_size: 20\n");
  CliConfig cfg;
  testing::internal::CaptureStdout();
  mo::load_or_create_config(path.string(), cfg);
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
  EXPECT_EQ(cfg.history_size, 20);
}

TEST(CliHistory, NavigationByPrefix) {
  auto dir = mo_test::scratch_dir();
  CliHistory history(dir / "history");
  history.Add("set fps 1");
  history.Add("show");
  history.Add("show");
  history.Add("set ram 1");
  EXPECT_EQ(history.Size(), 3u);

  EXPECT_EQ(history.GetPrevious(""), "set ram 1");
  EXPECT_EQ(history.GetPrevious(""), "show");
  EXPECT_EQ(history.GetNext(""), "set ram 1");
  EXPECT_EQ(history.GetNext(""), "");

  history.ResetNavigation();
  EXPECT_EQ(history.GetPrevious("set"), "set ram 1");
  EXPECT_EQ(history.GetPrevious("set"), "set fps 1");
  EXPECT_EQ(history.GetPrevious("set"), "set");
}

TEST(CliHistory, PersistsAndTrims) {
  auto dir = mo_test::scratch_dir();
  const auto file = dir / "history";
  {
    CliHistory history(file);
    history.Add("one");
    history.Add("two");
    history.Add("three");
    history.Save();
  }
  CliHistory reloaded(file);
  EXPECT_EQ(reloaded.Size(), 3u);
  EXPECT_EQ(reloaded.Path(), file);

  reloaded.SetMaxSize(2);
  EXPECT_EQ(reloaded.Size(), 2u);
  EXPECT_EQ(reloaded.GetPrevious(""), "three");
  EXPECT_EQ(reloaded.GetPrevious(""), "two");
  EXPECT_EQ(reloaded.GetPrevious(""), "");
}
