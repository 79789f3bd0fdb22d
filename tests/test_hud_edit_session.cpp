#include <gtest/gtest.h>

#include "cli/hud_edit_session.hpp"
#include "kernel/interaction.hpp"
#include "kernel/kernel.hpp"
#include "test_util.hpp"

using mo::CliConfig;
using mo::HudEditSession;
using mo::InteractionService;
using mo::Kernel;

namespace {

bool file_has(const mo_test::fs::path& path, const std::string& line) {
  return mo_test::read_file(path).find(line + "\n") != std::string::npos;
}

}  // namespace

TEST(HudEditSession, WriteSavesEveryTime) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "game.conf";
  CliConfig settings;
  settings.backup_on_save = false;
  ASSERT_TRUE(svc.cmd_new("doc", true, path));

  HudEditSession session(svc, "doc", settings, *svc.cmd_snapshot("doc"));
  ASSERT_TRUE(session.assign("gpu_temp", "1"));
  EXPECT_TRUE(session.dirty());
  EXPECT_FALSE(session.execute("w"));
  EXPECT_TRUE(session.saved());
  EXPECT_TRUE(file_has(path, "gpu_temp=1"));

  // A second :w after more edits writes again
  ASSERT_TRUE(session.assign("ram", "1"));
  EXPECT_FALSE(session.execute("w"));
  EXPECT_TRUE(file_has(path, "ram=1"));

  ASSERT_TRUE(session.assign("vram", "1"));
  EXPECT_TRUE(session.execute("wq"));
  EXPECT_TRUE(session.saved());
  EXPECT_TRUE(file_has(path, "vram=1"));
  EXPECT_EQ(svc.cmd_is_dirty("doc"), std::optional<bool>(false));
}

TEST(HudEditSession, ApplyClearsSavedState) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  CliConfig settings;
  settings.backup_on_save = false;
  ASSERT_TRUE(svc.cmd_new("doc", true, dir / "game.conf"));

  HudEditSession session(svc, "doc", settings, *svc.cmd_snapshot("doc"));
  ASSERT_TRUE(session.assign("gpu_temp", "1"));
  ASSERT_FALSE(session.execute("w"));
  ASSERT_TRUE(session.saved());

  ASSERT_TRUE(session.assign("ram", "1"));
  EXPECT_FALSE(session.execute("a"));
  EXPECT_TRUE(session.applied());
  EXPECT_FALSE(session.saved());
  EXPECT_EQ(svc.cmd_get("doc", "ram"), std::optional<std::string>("1"));
  EXPECT_FALSE(file_has(dir / "game.conf", "ram=1"));
}

TEST(HudEditSession, AutoSaveOnApply) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "game.conf";
  CliConfig settings;
  settings.backup_on_save = false;
  settings.editor_save_behavior = "auto_save_on_apply";
  ASSERT_TRUE(svc.cmd_new("doc", true, path));

  HudEditSession session(svc, "doc", settings, *svc.cmd_snapshot("doc"));
  ASSERT_TRUE(session.assign("fps_limit", "60"));
  EXPECT_FALSE(session.execute("a"));
  EXPECT_TRUE(session.saved());
  EXPECT_TRUE(file_has(path, "fps_limit=60"));
}

TEST(HudEditSession, QuitRefusesUnappliedChanges) {
  Kernel kernel;
  InteractionService svc(kernel);
  CliConfig settings;
  ASSERT_TRUE(svc.cmd_new("doc", true));

  HudEditSession session(svc, "doc", settings, *svc.cmd_snapshot("doc"));
  EXPECT_TRUE(session.execute("q"));
  ASSERT_TRUE(session.assign("ram", "1"));
  EXPECT_FALSE(session.execute("q"));
  EXPECT_NE(session.status().find("Unapplied"), std::string::npos);
  EXPECT_TRUE(session.execute("q!"));
  EXPECT_FALSE(session.applied());
  EXPECT_EQ(svc.cmd_get("doc", "ram"), std::optional<std::string>("0"));
}

TEST(HudEditSession, WriteWithoutFileStaysOpen) {
  Kernel kernel;
  InteractionService svc(kernel);
  CliConfig settings;
  ASSERT_TRUE(svc.cmd_new("doc", true));

  HudEditSession session(svc, "doc", settings, *svc.cmd_snapshot("doc"));
  ASSERT_TRUE(session.assign("ram", "1"));
  EXPECT_FALSE(session.execute("wq"));
  EXPECT_TRUE(session.applied());
  EXPECT_FALSE(session.saved());
  EXPECT_NE(session.status().find("no file"), std::string::npos);

  EXPECT_FALSE(session.assign("fps_limit", "lots"));
  EXPECT_EQ(session.status().rfind("Error: ", 0), 0u);
  EXPECT_FALSE(session.execute("bogus"));
}
