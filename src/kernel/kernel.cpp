// Mangoverlay kernel: Kernel implementation
#include "kernel/kernel.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "hud/layout.hpp"
#include "hud/param_registry.hpp"
#include "hud/presets.hpp"

namespace mo {

Document* Kernel::find(const std::string& name) {
    auto it = docs_.find(name);
    return it == docs_.end() ? nullptr : &it->second;
}

const Document* Kernel::find(const std::string& name) const {
    auto it = docs_.find(name);
    return it == docs_.end() ? nullptr : &it->second;
}

void Kernel::record_error(const std::string& name, ConfigErrc code, const std::string& message) {
    last_error_[name] = LastError{code, message};
}

template <typename Fn>
bool Kernel::with_document(const std::string& name, Fn&& fn) {
    Document* doc = find(name);
    if (!doc) {
        record_error(name, ConfigErrc::NoDocument, "No document named '" + name + "'");
        return false;
    }
    try {
        fn(*doc);
        last_error_.erase(name);
        return true;
    } catch (const ConfigError& e) {
        record_error(name, e.code(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        record_error(name, ConfigErrc::Io, e.what());
    } catch (const nlohmann::json::exception& e) {
        record_error(name, ConfigErrc::Io, e.what());
    }
    return false;
}

std::optional<std::string> Kernel::open_document(const std::string& name, const fs::path& path) {
    if (docs_.count(name)) {
        record_error(name, ConfigErrc::Unknown, "Document '" + name + "' is already open");
        return std::nullopt;
    }
    Document doc;
    doc.name = name;
    try {
        io_.load(doc, path);
    } catch (const ConfigError& e) {
        record_error(name, e.code(), e.what());
        return std::nullopt;
    }
    docs_.emplace(name, std::move(doc));
    last_error_.erase(name);
    return name;
}

std::optional<std::string> Kernel::open_env_document(const std::string& name, const std::string& env_text) {
    if (docs_.count(name)) {
        record_error(name, ConfigErrc::Unknown, "Document '" + name + "' is already open");
        return std::nullopt;
    }
    Document doc;
    doc.name = name;
    io_.load_env(doc, env_text);
    docs_.emplace(name, std::move(doc));
    last_error_.erase(name);
    return name;
}

std::optional<std::string> Kernel::new_document(const std::string& name, bool legacy_layout, const fs::path& path) {
    if (docs_.count(name)) {
        record_error(name, ConfigErrc::Unknown, "Document '" + name + "' is already open");
        return std::nullopt;
    }
    Document doc;
    doc.name = name;
    doc.path = path;
    doc.config = default_config(legacy_layout);
    doc.dirty = true;
    docs_.emplace(name, std::move(doc));
    last_error_.erase(name);
    return name;
}

bool Kernel::reload_document(const std::string& name) {
    return with_document(name, [this](Document& doc) {
        if (doc.path.empty()) throw ConfigError(ConfigErrc::Io, "Document '" + doc.name + "' has no file to reload");
        io_.load(doc, doc.path);
    });
}

bool Kernel::close_document(const std::string& name) {
    last_error_.erase(name);
    return docs_.erase(name) > 0;
}

std::vector<std::string> Kernel::list_documents() const {
    std::vector<std::string> out;
    for (const auto& kv : docs_) out.push_back(kv.first);
    return out;
}

bool Kernel::has_document(const std::string& name) const { return docs_.count(name) > 0; }

std::optional<std::string> Kernel::get_param(const std::string& name, const std::string& key) {
    std::optional<std::string> value;
    bool ok = with_document(name, [&](Document& doc) { value = get_value(doc.config, key).value_or(""); });
    if (!ok) return std::nullopt;
    return value;
}

bool Kernel::set_param(const std::string& name, const std::string& key, const std::string& value) {
    return with_document(name, [&](Document& doc) {
        assign_param(doc.config, key, value);
        doc.dirty = true;
    });
}

bool Kernel::reset_param(const std::string& name, const std::string& key) {
    return with_document(name, [&](Document& doc) {
        restore_param(doc.config, key);
        doc.dirty = true;
    });
}

std::optional<std::vector<Kernel::ParamRow>> Kernel::list_params(const std::string& name, bool only_changed,
                                                                 const std::string& section) {
    std::vector<ParamRow> rows;
    bool ok = with_document(name, [&](Document& doc) {
        if (!section.empty() && std::find(sections().begin(), sections().end(), section) == sections().end()) {
            throw ConfigError(ConfigErrc::NotFound, "Unknown section '" + section + "'");
        }
        for (const auto& p : all_params()) {
            if (!section.empty() && p.section != section) continue;
            bool def = is_default(doc.config, p.key);
            if (only_changed && def) continue;
            auto value = p.format(doc.config);
            rows.push_back({p.key, p.section, value.value_or(""), value.has_value(), def});
        }
    });
    if (!ok) return std::nullopt;
    return rows;
}

std::optional<std::vector<LayoutEntry>> Kernel::layout(const std::string& name) {
    std::vector<LayoutEntry> out;
    bool ok = with_document(name, [&](Document& doc) { out = doc.config.layout; });
    if (!ok) return std::nullopt;
    return out;
}

bool Kernel::layout_add(const std::string& name, const std::string& key, const std::string& value) {
    return with_document(name, [&](Document& doc) {
        if (!find_param(key)) throw ConfigError(ConfigErrc::UnknownKey, "Unknown parameter '" + key + "'");
        if (doc.config.legacy_layout) {
            throw ConfigError(ConfigErrc::InvalidValue, "Draw order only applies with legacy_layout=0");
        }
        if (!is_repeatable(key) &&
            std::any_of(doc.config.layout.begin(), doc.config.layout.end(),
                        [&](const LayoutEntry& e) { return e.key == key; })) {
            throw ConfigError(ConfigErrc::InvalidValue, "'" + key + "' is already in the layout");
        }
        mo::layout_add(doc.config, key, value);
        doc.dirty = true;
    });
}

bool Kernel::layout_remove(const std::string& name, size_t index) {
    return with_document(name, [&](Document& doc) {
        mo::layout_remove(doc.config, index);
        doc.dirty = true;
    });
}

std::optional<size_t> Kernel::layout_move(const std::string& name, size_t index, int delta) {
    size_t new_index = 0;
    bool ok = with_document(name, [&](Document& doc) {
        new_index = mo::layout_move(doc.config, index, delta);
        doc.dirty = true;
    });
    if (!ok) return std::nullopt;
    return new_index;
}

bool Kernel::apply_preset(const std::string& name, HudPreset preset) {
    return with_document(name, [&](Document& doc) {
        doc.config = mo::apply_preset(doc.config, preset);
        doc.dirty = true;
    });
}

std::optional<std::vector<ValidationIssue>> Kernel::validate(const std::string& name) {
    std::vector<ValidationIssue> issues;
    bool ok = with_document(name, [&](Document& doc) { issues = mo::validate(doc.config); });
    if (!ok) return std::nullopt;
    return issues;
}

std::optional<std::vector<Diagnostic>> Kernel::diagnostics(const std::string& name) {
    const Document* doc = find(name);
    if (!doc) {
        record_error(name, ConfigErrc::NoDocument, "No document named '" + name + "'");
        return std::nullopt;
    }
    return doc->diagnostics;
}

std::optional<std::vector<DiffEntry>> Kernel::diff(const std::string& left, const std::string& right) {
    const Document* l = find(left);
    const Document* r = find(right);
    if (!l || !r) {
        const std::string& missing = l ? right : left;
        record_error(missing, ConfigErrc::NoDocument, "No document named '" + missing + "'");
        return std::nullopt;
    }
    return diff_.diff(l->config, r->config);
}

bool Kernel::save_document(const std::string& name, const fs::path& path, const WriteOptions& options) {
    return with_document(name, [&](Document& doc) {
        io_.save(doc, path.empty() ? doc.path : path, options);
    });
}

std::optional<std::string> Kernel::render(const std::string& name, WriteMode mode) {
    std::string text;
    bool ok = with_document(name, [&](Document& doc) {
        WriteOptions opts;
        opts.mode = mode;
        text = write_config(doc.config, opts);
    });
    if (!ok) return std::nullopt;
    return text;
}

std::optional<std::string> Kernel::env_string(const std::string& name) {
    std::string text;
    bool ok = with_document(name, [&](Document& doc) { text = to_env_string(doc.config); });
    if (!ok) return std::nullopt;
    return text;
}

std::optional<std::string> Kernel::export_json(const std::string& name, bool only_changed) {
    std::string text;
    bool ok = with_document(name, [&](Document& doc) { text = io_.to_json(doc, only_changed); });
    if (!ok) return std::nullopt;
    return text;
}

bool Kernel::export_json_file(const std::string& name, const fs::path& path, bool only_changed) {
    return with_document(name, [&](Document& doc) { io_.save_json(doc, path, only_changed); });
}

std::optional<OverlayConfig> Kernel::config_snapshot(const std::string& name) {
    const Document* doc = find(name);
    if (!doc) {
        record_error(name, ConfigErrc::NoDocument, "No document named '" + name + "'");
        return std::nullopt;
    }
    return doc->config;
}

bool Kernel::replace_config(const std::string& name, const OverlayConfig& config) {
    return with_document(name, [&](Document& doc) {
        doc.config = config;
        doc.dirty = true;
    });
}

std::optional<fs::path> Kernel::document_path(const std::string& name) const {
    const Document* doc = find(name);
    if (!doc) return std::nullopt;
    return doc->path;
}

std::optional<bool> Kernel::is_dirty(const std::string& name) const {
    const Document* doc = find(name);
    if (!doc) return std::nullopt;
    return doc->dirty;
}

std::optional<Kernel::LastError> Kernel::last_error(const std::string& name) const {
    auto it = last_error_.find(name);
    if (it == last_error_.end()) return std::nullopt;
    return it->second;
}

} // namespace mo
