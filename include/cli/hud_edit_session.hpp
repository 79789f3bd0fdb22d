// Editing state behind the full-screen overlay editor
#pragma once

#include <string>

#include "cli_config.hpp"
#include "hud/overlay_config.hpp"
#include "kernel/interaction.hpp"

namespace mo {

// Holds a working copy of one document's config. Nothing reaches the kernel
// until apply(); save() writes whatever the kernel holds to the document's file.
class HudEditSession {
public:
    HudEditSession(InteractionService& svc, std::string doc, const CliConfig& settings, OverlayConfig config);

    const std::string& doc() const { return doc_; }
    const OverlayConfig& config() const { return working_; }
    const std::string& status() const { return status_; }
    void set_status(const std::string& status) { status_ = status; }

    // Working copy differs from what was last applied.
    bool dirty() const;
    // At least one apply() succeeded.
    bool applied() const { return applied_; }
    // The last applied state has been written to disk.
    bool saved() const { return saved_; }

    // Invalid input leaves the old value in place and reports in the status.
    bool assign(const std::string& key, const std::string& value);
    void reset(const std::string& key);

    bool apply();
    bool save();

    // Runs an editor command line (a, w, wq, q, q!). Returns true when the
    // editor should close.
    bool execute(const std::string& command);

private:
    InteractionService& svc_;
    std::string doc_;
    const CliConfig& settings_;
    OverlayConfig applied_config_;
    OverlayConfig working_;
    std::string status_ = "Ready";
    bool applied_ = false;
    bool saved_ = false;
};

} // namespace mo
