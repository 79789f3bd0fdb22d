#include "hud/config_writer.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

#include "hud/param_registry.hpp"
#include "hud/value_codec.hpp"

namespace mo {

std::string to_string(WriteMode mode) { return mode == WriteMode::Full ? "full" : "minimal"; }

WriteMode parse_write_mode(const std::string& s) {
    const std::string v = to_lower(trim(s));
    if (v == "full") return WriteMode::Full;
    if (v == "minimal") return WriteMode::Minimal;
    throw ConfigError(ConfigErrc::InvalidValue, "Invalid write mode '" + s + "': expected minimal or full");
}

namespace {

struct Line {
    std::string section; // empty for lines outside the table (layout, extras)
    std::string key;
    std::string value;
    bool bare = false;
};

// Ordering: legacy_layout=0 first, then the layout in draw order, then the
// remaining parameters in table order, then unknown keys.
std::vector<Line> collect_lines(const OverlayConfig& config, WriteMode mode) {
    std::vector<Line> lines;
    std::set<std::string> written;
    const OverlayConfig defaults = default_config(config.legacy_layout);

    if (!config.legacy_layout) {
        lines.push_back({"", "legacy_layout", "0"});
        written.insert("legacy_layout");
        for (const auto& e : config.layout) {
            lines.push_back({"Layout", e.key, e.value});
            written.insert(e.key);
        }
    }

    for (const auto& p : all_params()) {
        if (written.count(p.key)) continue;
        auto value = p.format(config);
        if (!value) continue;
        bool changed = value != p.format(defaults);
        if (!config.legacy_layout && p.orderable && !changed) continue;
        if (mode == WriteMode::Minimal && !changed) continue;
        lines.push_back({p.section, p.key, *value});
    }

    for (const auto& e : config.extras) {
        lines.push_back({"Unknown", e.key, e.value, e.bare});
    }
    return lines;
}

} // namespace

std::string write_config(const OverlayConfig& config, const WriteOptions& options) {
    std::ostringstream out;
    if (options.header) {
        out << "### MangoHud configuration written by mangoverlay\n";
        if (options.mode == WriteMode::Minimal) out << "### Parameters left out use MangoHud defaults\n";
        out << "\n";
    }
    std::string current_section;
    for (const auto& line : collect_lines(config, options.mode)) {
        if (options.mode == WriteMode::Full && !line.section.empty() && line.section != current_section) {
            if (!current_section.empty()) out << "\n";
            out << "### " << line.section << "\n";
            current_section = line.section;
        }
        if (line.bare) out << line.key << "\n";
        else out << line.key << "=" << line.value << "\n";
    }
    return out.str();
}

void write_config_file(const OverlayConfig& config, const fs::path& path, const WriteOptions& options) {
    std::error_code ec;
    if (options.backup && fs::exists(path, ec)) {
        fs::path backup = path;
        backup += ".bak";
        fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ConfigError(ConfigErrc::Io, "Failed to write backup " + backup.string() + ": " + ec.message());
        }
    }
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream fout(path);
    if (!fout) {
        throw ConfigError(ConfigErrc::Io, "Failed to open file for writing: " + path.string());
    }
    fout << write_config(config, options);
    fout.flush();
    if (!fout) {
        throw ConfigError(ConfigErrc::Io, "Failed to write file: " + path.string());
    }
}

std::string to_env_string(const OverlayConfig& config) {
    std::vector<std::string> pairs;
    for (const auto& line : collect_lines(config, WriteMode::Minimal)) {
        const ParamSpec* spec = find_param(line.key);
        if (line.bare || (spec && spec->kind == ParamKind::Bool && line.value == "1")) {
            pairs.push_back(line.key);
            continue;
        }
        std::string value = line.value;
        if (spec && spec->is_list) value = join_list(split_list(value, ","), '+');
        pairs.push_back(line.key + "=" + value);
    }
    return join_list(pairs, ',');
}

} // namespace mo
