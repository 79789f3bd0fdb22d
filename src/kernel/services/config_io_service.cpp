#include "kernel/services/config_io_service.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

#include "hud/config_parser.hpp"
#include "hud/param_registry.hpp"

namespace mo {

void ConfigIoService::load(Document& doc,
                           const std::filesystem::path& path) const {
  ParseResult result = parse_config_file(path);
  doc.config = std::move(result.config);
  doc.diagnostics = std::move(result.diagnostics);
  doc.path = path;
  doc.dirty = false;
}

void ConfigIoService::load_env(Document& doc,
                               const std::string& env_text) const {
  ParseResult result = parse_env_config(env_text);
  doc.config = std::move(result.config);
  doc.diagnostics = std::move(result.diagnostics);
  doc.path.clear();
  doc.dirty = true;
}

void ConfigIoService::save(Document& doc, const std::filesystem::path& path,
                           const WriteOptions& options) const {
  if (path.empty()) {
    throw ConfigError(ConfigErrc::Io,
                      "Document '" + doc.name + "' has no file path yet.");
  }
  write_config_file(doc.config, path, options);
  doc.path = path;
  doc.dirty = false;
}

std::string ConfigIoService::to_json(const Document& doc,
                                     bool only_changed) const {
  nlohmann::json root;
  root["path"] = doc.path.string();
  root["legacy_layout"] = doc.config.legacy_layout;

  nlohmann::json params = nlohmann::json::object();
  for (const auto& p : all_params()) {
    if (only_changed && is_default(doc.config, p.key)) continue;
    auto value = p.format(doc.config);
    if (value)
      params[p.key] = *value;
    else
      params[p.key] = nullptr;
  }
  root["params"] = params;

  nlohmann::json layout = nlohmann::json::array();
  for (const auto& e : doc.config.layout) {
    layout.push_back(nlohmann::json::array({e.key, e.value}));
  }
  root["layout"] = layout;

  nlohmann::json extras = nlohmann::json::array();
  for (const auto& e : doc.config.extras) {
    nlohmann::json x;
    x["key"] = e.key;
    if (!e.bare) x["value"] = e.value;
    extras.push_back(x);
  }
  root["extras"] = extras;
  // Bytes that are not UTF-8 (Latin-1 custom_text) become U+FFFD
  return root.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ConfigIoService::save_json(const Document& doc,
                                const std::filesystem::path& path,
                                bool only_changed) const {
  std::ofstream fout(path);
  if (!fout) {
    throw ConfigError(ConfigErrc::Io,
                      "Failed to open file for writing: " + path.string());
  }
  fout << to_json(doc, only_changed) << "\n";
  if (!fout) {
    throw ConfigError(ConfigErrc::Io, "Failed to write file: " + path.string());
  }
}

}  // namespace mo
