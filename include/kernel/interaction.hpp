// Mangoverlay kernel: Interaction API between CLI and Kernel
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"

namespace mo {

// Minimal interaction facade to decouple frontends from Kernel internals.
class InteractionService {
public:
    explicit InteractionService(Kernel& kernel) : kernel_(kernel) {}

    // Document lifecycle
    std::optional<std::string> cmd_open(const std::string& name, const fs::path& path) {
        return kernel_.open_document(name, path);
    }
    std::optional<std::string> cmd_open_env(const std::string& name, const std::string& env_text) {
        return kernel_.open_env_document(name, env_text);
    }
    std::optional<std::string> cmd_new(const std::string& name, bool legacy_layout, const fs::path& path = {}) {
        return kernel_.new_document(name, legacy_layout, path);
    }
    bool cmd_reload(const std::string& name) { return kernel_.reload_document(name); }
    bool cmd_close(const std::string& name) { return kernel_.close_document(name); }
    std::vector<std::string> cmd_list_documents() const { return kernel_.list_documents(); }
    bool cmd_has_document(const std::string& name) const { return kernel_.has_document(name); }

    // Parameters
    std::optional<std::string> cmd_get(const std::string& doc, const std::string& key) {
        return kernel_.get_param(doc, key);
    }
    bool cmd_set(const std::string& doc, const std::string& key, const std::string& value) {
        return kernel_.set_param(doc, key, value);
    }
    bool cmd_reset(const std::string& doc, const std::string& key) { return kernel_.reset_param(doc, key); }
    std::optional<std::vector<Kernel::ParamRow>> cmd_params(const std::string& doc, bool only_changed,
                                                            const std::string& section = "") {
        return kernel_.list_params(doc, only_changed, section);
    }

    // Draw order
    std::optional<std::vector<LayoutEntry>> cmd_layout(const std::string& doc) { return kernel_.layout(doc); }
    bool cmd_layout_add(const std::string& doc, const std::string& key, const std::string& value) {
        return kernel_.layout_add(doc, key, value);
    }
    bool cmd_layout_remove(const std::string& doc, size_t index) { return kernel_.layout_remove(doc, index); }
    std::optional<size_t> cmd_layout_move(const std::string& doc, size_t index, int delta) {
        return kernel_.layout_move(doc, index, delta);
    }

    bool cmd_apply_preset(const std::string& doc, HudPreset preset) { return kernel_.apply_preset(doc, preset); }
    std::optional<std::vector<ValidationIssue>> cmd_validate(const std::string& doc) { return kernel_.validate(doc); }
    std::optional<std::vector<Diagnostic>> cmd_diagnostics(const std::string& doc) { return kernel_.diagnostics(doc); }
    std::optional<std::vector<DiffEntry>> cmd_diff(const std::string& left, const std::string& right) {
        return kernel_.diff(left, right);
    }

    // Output
    bool cmd_save(const std::string& doc, const fs::path& path, const WriteOptions& options) {
        return kernel_.save_document(doc, path, options);
    }
    std::optional<std::string> cmd_render(const std::string& doc, WriteMode mode) { return kernel_.render(doc, mode); }
    std::optional<std::string> cmd_env(const std::string& doc) { return kernel_.env_string(doc); }
    std::optional<std::string> cmd_export_json(const std::string& doc, bool only_changed) {
        return kernel_.export_json(doc, only_changed);
    }
    bool cmd_export_json_file(const std::string& doc, const fs::path& path, bool only_changed) {
        return kernel_.export_json_file(doc, path, only_changed);
    }

    std::optional<OverlayConfig> cmd_snapshot(const std::string& doc) { return kernel_.config_snapshot(doc); }
    bool cmd_replace_config(const std::string& doc, const OverlayConfig& config) {
        return kernel_.replace_config(doc, config);
    }
    std::optional<fs::path> cmd_document_path(const std::string& doc) const { return kernel_.document_path(doc); }
    std::optional<bool> cmd_is_dirty(const std::string& doc) const { return kernel_.is_dirty(doc); }

    std::optional<Kernel::LastError> cmd_last_error(const std::string& doc) const {
        return kernel_.last_error(doc);
    }
private:
    Kernel& kernel_;
};

} // namespace mo
