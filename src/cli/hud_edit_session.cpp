#include "cli/hud_edit_session.hpp"

#include <utility>

#include "hud/layout.hpp"
#include "hud/param_registry.hpp"
#include "hud/value_codec.hpp"
#include "mo_types.hpp"

namespace mo {

HudEditSession::HudEditSession(InteractionService& svc, std::string doc, const CliConfig& settings,
                               OverlayConfig config)
    : svc_(svc), doc_(std::move(doc)), settings_(settings), applied_config_(config), working_(std::move(config)) {}

bool HudEditSession::dirty() const { return !same_values(working_, applied_config_); }

bool HudEditSession::assign(const std::string& key, const std::string& value) {
    try {
        assign_param(working_, key, value);
        status_ = key + " = " + get_value(working_, key).value_or("(unset)");
        return true;
    } catch (const ConfigError& e) {
        status_ = std::string("Error: ") + e.what();
        return false;
    }
}

void HudEditSession::reset(const std::string& key) {
    restore_param(working_, key);
    status_ = key + " reset to default";
}

bool HudEditSession::apply() {
    if (!svc_.cmd_replace_config(doc_, working_)) {
        auto err = svc_.cmd_last_error(doc_);
        status_ = "Error: " + (err ? err->message : std::string("could not apply changes"));
        return false;
    }
    applied_config_ = working_;
    applied_ = true;
    saved_ = false;
    status_ = "Changes applied to '" + doc_ + "'.";
    if (settings_.editor_save_behavior == "auto_save_on_apply") return save();
    return true;
}

bool HudEditSession::save() {
    auto path = svc_.cmd_document_path(doc_);
    if (!path || path->empty()) {
        status_ = "Error: '" + doc_ + "' has no file yet. Use 'save <file>' in the shell.";
        return false;
    }
    if (!svc_.cmd_save(doc_, {}, to_write_options(settings_))) {
        auto err = svc_.cmd_last_error(doc_);
        status_ = "Error: " + (err ? err->message : std::string("save failed"));
        return false;
    }
    saved_ = true;
    status_ = "Saved to " + path->string();
    return true;
}

bool HudEditSession::execute(const std::string& command) {
    const std::string cmd = to_lower(trim(command));
    if (cmd == "a" || cmd == "apply") {
        apply();
    } else if (cmd == "w" || cmd == "write" || cmd == "wq") {
        // apply() may already have saved (auto_save_on_apply)
        if (!apply()) return false;
        if (!saved_ && !save()) return false;
        return cmd == "wq";
    } else if (cmd == "q" || cmd == "quit") {
        if (dirty()) {
            status_ = "Unapplied changes. Use :a first or :q! to discard.";
            return false;
        }
        return true;
    } else if (cmd == "q!") {
        return true;
    } else {
        status_ = "Error: Unknown command '" + cmd + "'";
    }
    return false;
}

} // namespace mo
