#include "hud/config_parser.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "hud/layout.hpp"
#include "hud/param_registry.hpp"
#include "hud/value_codec.hpp"

namespace mo {

const char* to_string(Severity s) {
    switch (s) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

bool ParseResult::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return d.severity == Severity::Error; });
}

namespace {

struct RawEntry {
    int line = 0;
    std::string key;
    std::string value;
    bool bare = false;
};

std::vector<RawEntry> tokenize_lines(const std::string& text) {
    std::vector<RawEntry> out;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        RawEntry e;
        e.line = line_no;
        auto eq = t.find('=');
        if (eq == std::string::npos) {
            e.key = t;
            e.bare = true;
        } else {
            e.key = trim(t.substr(0, eq));
            e.value = trim(t.substr(eq + 1));
        }
        out.push_back(std::move(e));
    }
    return out;
}

// Pairs are separated by ','. A fragment without '=' that follows a list
// parameter continues that list ("fps_color=B22222,FDFD09,39F900").
std::vector<RawEntry> tokenize_env(const std::string& text) {
    std::vector<RawEntry> out;
    int index = 0;
    for (const auto& piece : split_list(text, ",")) {
        ++index;
        auto eq = piece.find('=');
        if (eq == std::string::npos) {
            if (!out.empty() && !out.back().bare && !find_param(piece)) {
                const ParamSpec* prev = find_param(out.back().key);
                if (prev && prev->is_list) {
                    out.back().value += "," + piece;
                    continue;
                }
            }
            out.push_back({index, piece, "", true});
        } else {
            out.push_back({index, trim(piece.substr(0, eq)), trim(piece.substr(eq + 1)), false});
        }
    }
    return out;
}

void report(ParseResult& result, const ParseOptions& options, const RawEntry& e,
            const std::string& message, Severity severity) {
    if (severity == Severity::Error && options.strict) {
        throw ConfigError(ConfigErrc::Parse, "line " + std::to_string(e.line) + ": " + message);
    }
    result.diagnostics.push_back({e.line, e.key, message, severity});
}

ParseResult parse_entries(const std::vector<RawEntry>& entries, const ParseOptions& options) {
    // legacy_layout decides which defaults are in effect, so it is read first.
    bool legacy = true;
    for (const auto& e : entries) {
        if (e.key != "legacy_layout") continue;
        try {
            legacy = e.bare ? true : parse_bool(e.value);
        } catch (const ConfigError&) {
            // reported by the main pass
        }
    }

    ParseResult result;
    result.config = default_config(legacy);
    OverlayConfig& config = result.config;

    for (const auto& e : entries) {
        const ParamSpec* spec = find_param(e.key);
        if (!spec) {
            report(result, options, e, "Unknown parameter '" + e.key + "' (kept as is)", Severity::Warning);
            config.extras.push_back({e.key, e.value, e.bare});
            continue;
        }
        std::string value = e.value;
        if (e.bare) {
            if (spec->kind != ParamKind::Bool) {
                report(result, options, e, "'" + e.key + "' requires a value", Severity::Error);
                continue;
            }
            value = "1";
        }
        try {
            set_value(config, e.key, value);
        } catch (const ConfigError& err) {
            report(result, options, e, err.what(), Severity::Error);
            continue;
        }
        if (e.key == "legacy_layout") {
            config.legacy_layout = legacy;
            continue;
        }
        if (!config.legacy_layout && spec->orderable) {
            if (spec->repeatable) config.layout.push_back({e.key, get_value(config, e.key).value_or("")});
            else layout_sync(config, e.key);
        }
    }
    return result;
}

} // namespace

ParseResult parse_config(const std::string& text, const ParseOptions& options) {
    return parse_entries(tokenize_lines(text), options);
}

ParseResult parse_config_file(const fs::path& path, const ParseOptions& options) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ConfigError(ConfigErrc::NotFound, "Config file not found: " + path.string());
    }
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(ConfigErrc::Io, "Failed to open config file: " + path.string());
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw ConfigError(ConfigErrc::Io, "Failed to read config file: " + path.string());
    }
    return parse_config(buf.str(), options);
}

ParseResult parse_env_config(const std::string& text, const ParseOptions& options) {
    return parse_entries(tokenize_env(text), options);
}

} // namespace mo
