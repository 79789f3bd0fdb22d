// Tool settings YAML read/write implementation
#include "cli_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include "mo_types.hpp" // for mo::fs alias

namespace mo {

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Mangoverlay settings. The MangoHud config itself is never stored here.";
    root["history_size"] = config.history_size;
    root["write_mode"] = config.write_mode;
    root["backup_on_save"] = config.backup_on_save;
    root["config_save_behavior"] = config.config_save_behavior;
    root["editor_save_behavior"] = config.editor_save_behavior;
    root["default_app"] = config.default_app;
    root["show_defaults"] = config.show_defaults;
    root["default_export_path"] = config.default_export_path;
    root["exit_prompt_save"] = config.exit_prompt_save;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["history_size"]) config.history_size = root["history_size"].as<int>();
            if (root["write_mode"]) config.write_mode = root["write_mode"].as<std::string>();
            if (root["backup_on_save"]) config.backup_on_save = root["backup_on_save"].as<bool>();
            if (root["config_save_behavior"]) config.config_save_behavior = root["config_save_behavior"].as<std::string>();
            if (root["editor_save_behavior"]) config.editor_save_behavior = root["editor_save_behavior"].as<std::string>();
            if (root["default_app"]) config.default_app = root["default_app"].as<std::string>();
            if (root["show_defaults"]) config.show_defaults = root["show_defaults"].as<bool>();
            if (root["default_export_path"]) config.default_export_path = root["default_export_path"].as<std::string>();
            if (root["exit_prompt_save"]) config.exit_prompt_save = root["exit_prompt_save"].as<bool>();
            if (config.write_mode != "minimal" && config.write_mode != "full") {
                std::cerr << "Warning: Unknown write_mode '" << config.write_mode << "' in '" << config_path
                          << "'. Using 'minimal'." << std::endl;
                config.write_mode = "minimal";
            }
            std::cerr << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "config.yaml") {
        std::cerr << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        config = CliConfig{};
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        }
    }
}

WriteOptions to_write_options(const CliConfig& config) {
    WriteOptions opts;
    opts.mode = config.write_mode == "full" ? WriteMode::Full : WriteMode::Minimal;
    opts.backup = config.backup_on_save;
    return opts;
}

} // namespace mo
