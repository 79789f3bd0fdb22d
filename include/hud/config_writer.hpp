// Writer for MangoHud's key=value config format.
#pragma once

#include <string>

#include "hud/overlay_config.hpp"
#include "mo_types.hpp"

namespace mo {

enum class WriteMode {
    Minimal, // only values that differ from the defaults
    Full,    // every parameter, grouped by section
};

std::string to_string(WriteMode mode);
WriteMode parse_write_mode(const std::string& s);

struct WriteOptions {
    WriteMode mode = WriteMode::Minimal;
    bool header = true;
    // Copy an existing file to <path>.bak before overwriting it.
    bool backup = false;
};

std::string write_config(const OverlayConfig& config, const WriteOptions& options = {});

// Throws ConfigError(Io) when the file (or its backup) cannot be written.
void write_config_file(const OverlayConfig& config, const fs::path& path, const WriteOptions& options = {});

// Value for the MANGOHUD_CONFIG environment variable. Pairs are joined with
// ',' and list items with '+'.
std::string to_env_string(const OverlayConfig& config);

} // namespace mo
