// Mangoverlay tool settings (distinct from the MangoHud config being edited)
#pragma once

#include <string>

#include "hud/config_writer.hpp"

namespace mo {

struct CliConfig {
    std::string loaded_config_path;
    int history_size = 1000;
    // Layout of saved MangoHud files: "minimal" (changed keys only) or "full".
    std::string write_mode = "minimal";
    bool backup_on_save = true;
    std::string config_save_behavior = "current";
    std::string editor_save_behavior = "ask";
    // App name used to resolve a per-app config when none is given.
    std::string default_app = "";
    bool show_defaults = false;
    std::string default_export_path = "mangohud.json";
    bool exit_prompt_save = true;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// Write options for saving MangoHud files under these settings.
WriteOptions to_write_options(const CliConfig& config);

} // namespace mo
