// Mangoverlay kernel: named MangoHud config documents
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hud/config_writer.hpp"
#include "hud/validation.hpp"
#include "kernel/document.hpp"
#include "kernel/services/config_diff_service.hpp"
#include "kernel/services/config_io_service.hpp"

namespace mo {

class Kernel {
public:
    struct LastError { ConfigErrc code = ConfigErrc::Unknown; std::string message; };

    struct ParamRow {
        std::string key;
        std::string section;
        std::string value; // empty for an unset optional
        bool is_set = true;
        bool is_default = true;
    };

    // Document lifecycle. Each returns the document name on success.
    std::optional<std::string> open_document(const std::string& name, const fs::path& path);
    std::optional<std::string> open_env_document(const std::string& name, const std::string& env_text);
    std::optional<std::string> new_document(const std::string& name, bool legacy_layout = true,
                                            const fs::path& path = {});
    bool reload_document(const std::string& name);
    bool close_document(const std::string& name);
    std::vector<std::string> list_documents() const;
    bool has_document(const std::string& name) const;

    // Parameters
    std::optional<std::string> get_param(const std::string& name, const std::string& key);
    bool set_param(const std::string& name, const std::string& key, const std::string& value);
    bool reset_param(const std::string& name, const std::string& key);
    std::optional<std::vector<ParamRow>> list_params(const std::string& name, bool only_changed,
                                                     const std::string& section = "");

    // Draw order (legacy_layout off)
    std::optional<std::vector<LayoutEntry>> layout(const std::string& name);
    bool layout_add(const std::string& name, const std::string& key, const std::string& value);
    bool layout_remove(const std::string& name, size_t index);
    std::optional<size_t> layout_move(const std::string& name, size_t index, int delta);

    bool apply_preset(const std::string& name, HudPreset preset);
    std::optional<std::vector<ValidationIssue>> validate(const std::string& name);
    std::optional<std::vector<Diagnostic>> diagnostics(const std::string& name);
    std::optional<std::vector<DiffEntry>> diff(const std::string& left, const std::string& right);

    // Output. An empty path saves to the document's own path.
    bool save_document(const std::string& name, const fs::path& path, const WriteOptions& options);
    std::optional<std::string> render(const std::string& name, WriteMode mode);
    std::optional<std::string> env_string(const std::string& name);
    std::optional<std::string> export_json(const std::string& name, bool only_changed);
    bool export_json_file(const std::string& name, const fs::path& path, bool only_changed);

    // Whole-config access for the editor front-end.
    std::optional<OverlayConfig> config_snapshot(const std::string& name);
    bool replace_config(const std::string& name, const OverlayConfig& config);
    std::optional<fs::path> document_path(const std::string& name) const;
    std::optional<bool> is_dirty(const std::string& name) const;

    std::optional<LastError> last_error(const std::string& name) const;

private:
    Document* find(const std::string& name);
    const Document* find(const std::string& name) const;
    void record_error(const std::string& name, ConfigErrc code, const std::string& message);

    // Runs `fn` on the named document, recording a ConfigError (or a missing
    // document) as the last error for `name`.
    template <typename Fn>
    bool with_document(const std::string& name, Fn&& fn);

    std::map<std::string, Document> docs_;
    std::map<std::string, LastError> last_error_;
    ConfigIoService io_;
    ConfigDiffService diff_;
};

} // namespace mo
