// Reader for MangoHud's key=value config format.
#pragma once

#include <string>
#include <vector>

#include "hud/overlay_config.hpp"
#include "mo_types.hpp"

namespace mo {

enum class Severity { Info, Warning, Error };

const char* to_string(Severity s);

struct Diagnostic {
    int line = 0; // 1-based; 0 when not tied to a line
    std::string key;
    std::string message;
    Severity severity = Severity::Warning;
};

struct ParseOptions {
    // Throw ConfigError(Parse) on the first invalid value instead of
    // recording a diagnostic.
    bool strict = false;
};

struct ParseResult {
    OverlayConfig config;
    std::vector<Diagnostic> diagnostics;

    bool has_errors() const;
};

// Blank lines and lines starting with '#' are skipped. A line without '='
// is a bare key and enables a boolean parameter. Later assignments win.
ParseResult parse_config(const std::string& text, const ParseOptions& options = {});

// Throws ConfigError(NotFound) if the file does not exist and
// ConfigError(Io) if it cannot be read.
ParseResult parse_config_file(const fs::path& path, const ParseOptions& options = {});

// The MANGOHUD_CONFIG form: "key=value,key,key=a+b".
ParseResult parse_env_config(const std::string& text, const ParseOptions& options = {});

} // namespace mo
