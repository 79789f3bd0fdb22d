#pragma once

#include <filesystem>
#include <string>

#include "hud/config_writer.hpp"
#include "kernel/document.hpp"

namespace mo {

class ConfigIoService {
 public:
  void load(Document& doc, const std::filesystem::path& path) const;
  void load_env(Document& doc, const std::string& env_text) const;
  void save(Document& doc, const std::filesystem::path& path,
            const WriteOptions& options) const;

  // {"path", "legacy_layout", "params", "layout", "extras"}
  std::string to_json(const Document& doc, bool only_changed) const;
  void save_json(const Document& doc, const std::filesystem::path& path,
                 bool only_changed) const;
};

}  // namespace mo
