// Descriptor table binding MangoHud keys to OverlayConfig fields.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "hud/overlay_config.hpp"

namespace mo {

enum class ParamKind {
    Bool, Int, Float, String, Path, Color, ColorList, IntPair, IntList, StringList,
    Enum, Keybind, Duration, OptionalInt,
};

const char* to_string(ParamKind kind);

struct ParamSpec {
    std::string key;
    std::string section;
    ParamKind kind = ParamKind::String;
    std::string description;
    // Drawn in file order when legacy_layout is off.
    bool orderable = false;
    // May appear several times in one file (custom_text, exec).
    bool repeatable = false;
    // Radio entries for Enum kinds.
    const std::vector<std::string>* choices = nullptr;

    std::function<void(OverlayConfig&, const std::string&)> parse;
    // std::nullopt for an unset optional.
    std::function<std::optional<std::string>(const OverlayConfig&)> format;
    std::function<void(OverlayConfig&, const OverlayConfig&)> copy_from;
    // List value: items joined with ',' in files and '+' in MANGOHUD_CONFIG.
    bool is_list = false;
};

const std::vector<ParamSpec>& all_params();
const ParamSpec* find_param(const std::string& key);

// Section names in display order.
const std::vector<std::string>& sections();
std::vector<const ParamSpec*> params_in_section(const std::string& section);

// All of these throw ConfigError(UnknownKey) for keys not in the table.
std::optional<std::string> get_value(const OverlayConfig& config, const std::string& key);
// Parses `value` into the field. Throws ConfigError(InvalidValue) and leaves
// the field untouched on bad input. An empty value unsets optional kinds.
void set_value(OverlayConfig& config, const std::string& key, const std::string& value);
// Restores the default that applies under the config's legacy_layout.
void reset_value(OverlayConfig& config, const std::string& key);
bool is_default(const OverlayConfig& config, const std::string& key);

// Keys whose value differs from the defaults, in table order.
std::vector<std::string> changed_keys(const OverlayConfig& config);

// Every registered value, the layout and the extras are equal.
bool same_values(const OverlayConfig& a, const OverlayConfig& b);

} // namespace mo
