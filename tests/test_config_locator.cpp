#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>

#include "hud/config_locator.hpp"
#include "test_util.hpp"

using namespace mo;

namespace {

// Points XDG_CONFIG_HOME at a scratch directory and clears
// MANGOHUD_CONFIGFILE for the duration of a test.
class ConfigLocatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    save("XDG_CONFIG_HOME", xdg_);
    save("MANGOHUD_CONFIGFILE", configfile_);
    root_ = mo_test::scratch_dir();
    setenv("XDG_CONFIG_HOME", root_.c_str(), 1);
    unsetenv("MANGOHUD_CONFIGFILE");
    dir_ = root_ / "MangoHud";
    fs::create_directories(dir_);
  }

  void TearDown() override {
    restore("XDG_CONFIG_HOME", xdg_);
    restore("MANGOHUD_CONFIGFILE", configfile_);
  }

  fs::path root_;
  fs::path dir_;

 private:
  static void save(const char* name, std::optional<std::string>& slot) {
    const char* v = std::getenv(name);
    if (v) slot = v;
  }
  static void restore(const char* name, const std::optional<std::string>& slot) {
    if (slot) setenv(name, slot->c_str(), 1);
    else unsetenv(name);
  }

  std::optional<std::string> xdg_;
  std::optional<std::string> configfile_;
};

}  // namespace

TEST_F(ConfigLocatorTest, ConfigDirFollowsXdg) {
  EXPECT_EQ(config_dir(), dir_);
  EXPECT_EQ(default_path(), dir_ / "MangoHud.conf");
  EXPECT_EQ(default_path("game.exe"), dir_ / "game.conf");
  EXPECT_EQ(app_basename("/opt/games/Game.EXE"), "Game");
}

TEST_F(ConfigLocatorTest, CandidateOrder) {
  ConfigQuery query;
  query.app = "game.exe";
  query.exe_dir = root_ / "bin";
  query.is_wine = true;
  auto paths = candidate_paths(query);
  ASSERT_EQ(paths.size(), 4u);
  EXPECT_EQ(paths[0], root_ / "bin" / "MangoHud.conf");
  EXPECT_EQ(paths[1], dir_ / "wine-game.conf");
  EXPECT_EQ(paths[2], dir_ / "game.conf");
  EXPECT_EQ(paths[3], dir_ / "MangoHud.conf");
}

TEST_F(ConfigLocatorTest, ResolvePicksFirstExisting) {
  ConfigQuery query;
  query.app = "game";
  EXPECT_FALSE(resolve(query).has_value());

  mo_test::write_file(dir_ / "MangoHud.conf", "fps\n");
  EXPECT_EQ(resolve(query), std::optional<fs::path>(dir_ / "MangoHud.conf"));

  mo_test::write_file(dir_ / "game.conf", "ram\n");
  EXPECT_EQ(resolve(query), std::optional<fs::path>(dir_ / "game.conf"));

  const fs::path forced = root_ / "forced.conf";
  mo_test::write_file(forced, "vram\n");
  setenv("MANGOHUD_CONFIGFILE", forced.c_str(), 1);
  EXPECT_EQ(resolve(query), std::optional<fs::path>(forced));
}

TEST_F(ConfigLocatorTest, ExeNamesUseWineConfig) {
  EXPECT_TRUE(query_for_app("Game.EXE").is_wine);
  EXPECT_FALSE(query_for_app("game").is_wine);
  EXPECT_FALSE(query_for_app("").is_wine);

  mo_test::write_file(dir_ / "game.conf", "ram\n");
  mo_test::write_file(dir_ / "wine-game.conf", "vram\n");
  EXPECT_EQ(resolve(query_for_app("game.exe")), std::optional<fs::path>(dir_ / "wine-game.conf"));
  EXPECT_EQ(resolve(query_for_app("game")), std::optional<fs::path>(dir_ / "game.conf"));
}
