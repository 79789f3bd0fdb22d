#include <gtest/gtest.h>

#include <map>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "kernel/interaction.hpp"
#include "kernel/kernel.hpp"
#include "test_util.hpp"

using mo::ConfigErrc;
using mo::InteractionService;
using mo::Kernel;

namespace {

ConfigErrc last_code(const InteractionService& svc, const std::string& doc) {
  auto err = svc.cmd_last_error(doc);
  return err ? err->code : ConfigErrc::Unknown;
}

}  // namespace

TEST(Kernel, OpenMissingFileRecordsNotFound) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  EXPECT_FALSE(svc.cmd_open("game", dir / "absent.conf").has_value());
  EXPECT_EQ(last_code(svc, "game"), ConfigErrc::NotFound);
  EXPECT_FALSE(svc.cmd_has_document("game"));
}

TEST(Kernel, SetGetResetMarkDirty) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_new("doc", true).has_value());
  EXPECT_FALSE(svc.cmd_new("doc", true).has_value());

  ASSERT_TRUE(svc.cmd_set("doc", "fps_limit", "60+144"));
  EXPECT_EQ(svc.cmd_get("doc", "fps_limit"), std::optional<std::string>("60,144"));
  EXPECT_EQ(svc.cmd_is_dirty("doc"), std::optional<bool>(true));

  EXPECT_FALSE(svc.cmd_set("doc", "fps_limit", "fast"));
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::InvalidValue);
  EXPECT_EQ(svc.cmd_get("doc", "fps_limit"), std::optional<std::string>("60,144"));
  // A successful call clears the recorded error
  EXPECT_FALSE(svc.cmd_last_error("doc").has_value());

  EXPECT_FALSE(svc.cmd_set("doc", "not_a_key", "1"));
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::UnknownKey);

  ASSERT_TRUE(svc.cmd_reset("doc", "fps_limit"));
  EXPECT_EQ(svc.cmd_get("doc", "fps_limit"), std::optional<std::string>("0"));
}

TEST(Kernel, MissingDocument) {
  Kernel kernel;
  InteractionService svc(kernel);
  EXPECT_FALSE(svc.cmd_get("nope", "fps").has_value());
  EXPECT_EQ(last_code(svc, "nope"), ConfigErrc::NoDocument);
  EXPECT_FALSE(svc.cmd_close("nope"));
  EXPECT_FALSE(svc.cmd_is_dirty("nope").has_value());
}

TEST(Kernel, ParamRows) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_new("doc", true));
  ASSERT_TRUE(svc.cmd_set("doc", "ram", "1"));
  auto changed = svc.cmd_params("doc", true);
  ASSERT_TRUE(changed.has_value());
  ASSERT_EQ(changed->size(), 1u);
  EXPECT_EQ((*changed)[0].key, "ram");
  EXPECT_EQ((*changed)[0].section, "Memory");
  EXPECT_FALSE((*changed)[0].is_default);

  auto keybinds = svc.cmd_params("doc", false, "Keybinds");
  ASSERT_TRUE(keybinds.has_value());
  EXPECT_EQ(keybinds->size(), 6u);

  auto vsync_rows = svc.cmd_params("doc", false, "Performance");
  ASSERT_TRUE(vsync_rows.has_value());
  EXPECT_FALSE((*vsync_rows)[2].is_set);

  EXPECT_FALSE(svc.cmd_params("doc", false, "Nowhere").has_value());
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::NotFound);
}

TEST(Kernel, LayoutEditing) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_new("doc", true));
  EXPECT_FALSE(svc.cmd_layout_add("doc", "ram", "1"));
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::InvalidValue);

  ASSERT_TRUE(svc.cmd_set("doc", "legacy_layout", "0"));
  auto layout = svc.cmd_layout("doc");
  ASSERT_TRUE(layout.has_value());
  ASSERT_EQ(layout->size(), 4u);

  // fps is already placed; custom_text may repeat
  EXPECT_FALSE(svc.cmd_layout_add("doc", "fps", "1"));
  EXPECT_TRUE(svc.cmd_layout_add("doc", "custom_text", "a"));
  EXPECT_TRUE(svc.cmd_layout_add("doc", "custom_text", "b"));
  EXPECT_EQ(svc.cmd_layout("doc")->size(), 6u);

  EXPECT_EQ(svc.cmd_layout_move("doc", 5, -5), std::optional<size_t>(0));
  EXPECT_EQ(svc.cmd_layout("doc")->front(), (mo::LayoutEntry{"custom_text", "b"}));
  EXPECT_TRUE(svc.cmd_layout_remove("doc", 0));
  EXPECT_EQ(svc.cmd_get("doc", "custom_text"), std::optional<std::string>("a"));
  EXPECT_FALSE(svc.cmd_layout_remove("doc", 42));
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::NotFound);
}

TEST(Kernel, SaveReloadAndDiff) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  const auto path = dir / "game.conf";
  mo::WriteOptions opts;
  opts.header = false;

  ASSERT_TRUE(svc.cmd_new("a", true, path));
  ASSERT_TRUE(svc.cmd_set("a", "gpu_temp", "1"));
  ASSERT_TRUE(svc.cmd_save("a", "", opts));
  EXPECT_EQ(svc.cmd_is_dirty("a"), std::optional<bool>(false));
  EXPECT_EQ(mo_test::read_file(path), "gpu_temp=1\n");

  ASSERT_TRUE(svc.cmd_open("b", path));
  auto same = svc.cmd_diff("a", "b");
  ASSERT_TRUE(same.has_value());
  EXPECT_TRUE(same->empty());

  ASSERT_TRUE(svc.cmd_set("b", "fps_limit", "60"));
  auto one = svc.cmd_diff("a", "b");
  ASSERT_TRUE(one.has_value());
  ASSERT_EQ(one->size(), 1u);
  EXPECT_EQ((*one)[0].key, "fps_limit");
  EXPECT_EQ((*one)[0].left, "0");
  EXPECT_EQ((*one)[0].right, "60");

  EXPECT_FALSE(svc.cmd_diff("a", "missing").has_value());
  EXPECT_EQ(last_code(svc, "missing"), ConfigErrc::NoDocument);

  // Changes on disk are picked up by reload and local edits are dropped
  mo_test::write_file(path, "gpu_temp=1\nram\n");
  ASSERT_TRUE(svc.cmd_reload("b"));
  EXPECT_EQ(svc.cmd_get("b", "ram"), std::optional<std::string>("1"));
  EXPECT_EQ(svc.cmd_get("b", "fps_limit"), std::optional<std::string>("0"));
  EXPECT_EQ(svc.cmd_is_dirty("b"), std::optional<bool>(false));
}

TEST(Kernel, DiagnosticsSurviveOpen) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  mo_test::write_file(dir / "bad.conf", "fps_limit=oops\nmystery=1\n");
  ASSERT_TRUE(svc.cmd_open("bad", dir / "bad.conf"));
  auto diags = svc.cmd_diagnostics("bad");
  ASSERT_TRUE(diags.has_value());
  ASSERT_EQ(diags->size(), 2u);
  EXPECT_EQ((*diags)[0].severity, mo::Severity::Error);
  EXPECT_EQ((*diags)[1].severity, mo::Severity::Warning);
}

TEST(Kernel, EnvDocumentHasNoPath) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_open_env("env", "fps_limit=30+60,ram"));
  EXPECT_EQ(svc.cmd_env("env"), std::optional<std::string>("fps_limit=30+60,ram"));
  EXPECT_EQ(svc.cmd_is_dirty("env"), std::optional<bool>(true));
  EXPECT_FALSE(svc.cmd_save("env", "", mo::WriteOptions{}));
  EXPECT_EQ(last_code(svc, "env"), ConfigErrc::Io);
  EXPECT_FALSE(svc.cmd_reload("env"));
}

TEST(Kernel, PresetAndValidate) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_new("doc", true));
  ASSERT_TRUE(svc.cmd_apply_preset("doc", mo::HudPreset::FpsOnly));
  EXPECT_EQ(svc.cmd_get("doc", "legacy_layout"), std::optional<std::string>("0"));
  auto issues = svc.cmd_validate("doc");
  ASSERT_TRUE(issues.has_value());
  EXPECT_FALSE(mo::has_errors(*issues));

  ASSERT_TRUE(svc.cmd_set("doc", "alpha", "3"));
  EXPECT_TRUE(mo::has_errors(*svc.cmd_validate("doc")));
}

TEST(Kernel, JsonExport) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  ASSERT_TRUE(svc.cmd_new("doc", false, dir / "doc.conf"));
  ASSERT_TRUE(svc.cmd_layout_add("doc", "custom_text", "hello"));
  ASSERT_TRUE(svc.cmd_open_env("other", "mystery"));

  auto text = svc.cmd_export_json("doc", true);
  ASSERT_TRUE(text.has_value());
  auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j["legacy_layout"], false);
  EXPECT_EQ(j["params"]["custom_text"], "hello");
  EXPECT_EQ(j["params"]["legacy_layout"], "0");
  EXPECT_EQ(j["params"].size(), 2u);
  ASSERT_EQ(j["layout"].size(), 1u);
  EXPECT_EQ(j["layout"][0][0], "custom_text");

  auto all = nlohmann::json::parse(*svc.cmd_export_json("doc", false));
  EXPECT_TRUE(all["params"]["vsync"].is_null());

  auto extras = nlohmann::json::parse(*svc.cmd_export_json("other", true))["extras"];
  ASSERT_EQ(extras.size(), 1u);
  EXPECT_EQ(extras[0]["key"], "mystery");
  EXPECT_FALSE(extras[0].contains("value"));

  const auto out = dir / "doc.json";
  ASSERT_TRUE(svc.cmd_export_json_file("doc", out, true));
  EXPECT_EQ(nlohmann::json::parse(mo_test::read_file(out)), j);
}

TEST(Kernel, SnapshotAndReplace) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_new("doc", true));
  auto snap = svc.cmd_snapshot("doc");
  ASSERT_TRUE(snap.has_value());
  snap->ram = true;
  ASSERT_TRUE(svc.cmd_replace_config("doc", *snap));
  EXPECT_EQ(svc.cmd_get("doc", "ram"), std::optional<std::string>("1"));
  EXPECT_TRUE(svc.cmd_close("doc"));
  EXPECT_TRUE(svc.cmd_list_documents().empty());
}

TEST(Kernel, JsonExportReplacesInvalidUtf8) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  mo_test::write_file(dir / "latin1.conf", "legacy_layout=0\ncustom_text=caf\xe9\n");
  ASSERT_TRUE(svc.cmd_open("doc", dir / "latin1.conf"));

  auto text = svc.cmd_export_json("doc", true);
  ASSERT_TRUE(text.has_value());
  auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j["params"]["custom_text"], "caf\xef\xbf\xbd");
  EXPECT_FALSE(svc.cmd_last_error("doc").has_value());
}

TEST(Kernel, DiffReportsLayoutAndExtras) {
  Kernel kernel;
  InteractionService svc(kernel);
  auto dir = mo_test::scratch_dir();
  mo_test::write_file(dir / "a.conf", "legacy_layout=0\nfps\nmystery=1\n");
  mo_test::write_file(dir / "b.conf", "legacy_layout=0\ngpu_stats\nfps\n");
  ASSERT_TRUE(svc.cmd_open("a", dir / "a.conf"));
  ASSERT_TRUE(svc.cmd_open("b", dir / "b.conf"));

  auto entries = svc.cmd_diff("a", "b");
  ASSERT_TRUE(entries.has_value());
  std::map<std::string, std::pair<std::string, std::string>> by_key;
  for (const auto& e : *entries) by_key[e.key] = {e.left, e.right};

  ASSERT_EQ(by_key.count("gpu_stats"), 1u);
  EXPECT_EQ(by_key["gpu_stats"], std::make_pair(std::string("0"), std::string("1")));
  EXPECT_EQ(by_key["layout[0]"], std::make_pair(std::string("fps=1"), std::string("gpu_stats=1")));
  EXPECT_EQ(by_key["layout[1]"], std::make_pair(std::string("(unset)"), std::string("fps=1")));
  EXPECT_EQ(by_key["extra:mystery"], std::make_pair(std::string("1"), std::string("(unset)")));
  EXPECT_EQ(by_key.size(), 4u);
}

TEST(Kernel, LayoutAddUnknownKey) {
  Kernel kernel;
  InteractionService svc(kernel);
  ASSERT_TRUE(svc.cmd_new("doc", false));
  EXPECT_FALSE(svc.cmd_layout_add("doc", "no_such_element", "1"));
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::UnknownKey);
  EXPECT_FALSE(svc.cmd_layout_add("doc", "font_size", "20"));
  EXPECT_EQ(last_code(svc, "doc"), ConfigErrc::InvalidValue);
}
