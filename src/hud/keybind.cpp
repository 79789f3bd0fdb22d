#include "hud/keybind.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>

#include "hud/value_codec.hpp"
#include "mo_types.hpp"

namespace mo {

const char* to_string(KeyModifier m) {
    switch (m) {
        case KeyModifier::ShiftL: return "Shift_L";
        case KeyModifier::ShiftR: return "Shift_R";
        case KeyModifier::ControlL: return "Control_L";
        case KeyModifier::ControlR: return "Control_R";
        case KeyModifier::AltL: return "Alt_L";
        case KeyModifier::AltR: return "Alt_R";
        case KeyModifier::SuperL: return "Super_L";
        case KeyModifier::SuperR: return "Super_R";
    }
    return "";
}

static std::optional<KeyModifier> modifier_from_token(const std::string& token) {
    static const std::unordered_map<std::string, KeyModifier> table = {
        {"shift", KeyModifier::ShiftL},     {"shift_l", KeyModifier::ShiftL},
        {"shift_r", KeyModifier::ShiftR},   {"control", KeyModifier::ControlL},
        {"ctrl", KeyModifier::ControlL},    {"control_l", KeyModifier::ControlL},
        {"control_r", KeyModifier::ControlR}, {"ctrl_l", KeyModifier::ControlL},
        {"ctrl_r", KeyModifier::ControlR},  {"alt", KeyModifier::AltL},
        {"alt_l", KeyModifier::AltL},       {"alt_r", KeyModifier::AltR},
        {"super", KeyModifier::SuperL},     {"super_l", KeyModifier::SuperL},
        {"super_r", KeyModifier::SuperR},
    };
    auto it = table.find(to_lower(token));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

// Canonical X keysym spelling for `name`, matched without regard to case.
static std::optional<std::string> canonical_key_name(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.size() == 1) {
        if (std::isalnum(static_cast<unsigned char>(name[0])) == 0) return std::nullopt;
        return name;
    }
    if ((name[0] == 'F' || name[0] == 'f') && name.size() <= 3) {
        try {
            return "F" + std::to_string(parse_int(name.substr(1), 1, 24));
        } catch (const ConfigError&) {
            return std::nullopt;
        }
    }
    static const std::vector<std::string> named = {
        "Home", "End", "Insert", "Delete", "Prior", "Next", "Page_Up", "Page_Down",
        "Pause", "Print", "Scroll_Lock", "Num_Lock", "Up", "Down", "Left", "Right",
        "Escape", "Tab", "space", "Return", "BackSpace", "minus", "equal", "grave",
        "KP_0", "KP_1", "KP_2", "KP_3", "KP_4", "KP_5", "KP_6", "KP_7", "KP_8", "KP_9",
        "KP_Add", "KP_Subtract", "KP_Multiply", "KP_Divide", "KP_Enter", "KP_Decimal",
    };
    const std::string wanted = to_lower(name);
    for (const auto& n : named) {
        if (to_lower(n) == wanted) return n;
    }
    return std::nullopt;
}

bool is_known_key_name(const std::string& name) { return canonical_key_name(name).has_value(); }

Keybind parse_keybind(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) throw ConfigError(ConfigErrc::InvalidValue, "Empty key binding");

    Keybind kb;
    std::string token;
    std::vector<std::string> tokens;
    for (char c : t) {
        if (c == '+') { tokens.push_back(trim(token)); token.clear(); }
        else token += c;
    }
    tokens.push_back(trim(token));

    for (const auto& tok : tokens) {
        if (tok.empty()) {
            throw ConfigError(ConfigErrc::InvalidValue, "Invalid key binding '" + text + "': empty key");
        }
        if (auto mod = modifier_from_token(tok)) {
            if (std::find(kb.modifiers.begin(), kb.modifiers.end(), *mod) == kb.modifiers.end())
                kb.modifiers.push_back(*mod);
            continue;
        }
        if (!kb.key.empty()) {
            throw ConfigError(ConfigErrc::InvalidValue, "Invalid key binding '" + text + "': more than one key");
        }
        auto key = canonical_key_name(tok);
        if (!key) {
            throw ConfigError(ConfigErrc::InvalidValue, "Invalid key binding '" + text + "': unknown key '" + tok + "'");
        }
        kb.key = *key;
    }
    if (kb.key.empty()) {
        throw ConfigError(ConfigErrc::InvalidValue, "Invalid key binding '" + text + "': no key");
    }
    return kb;
}

std::string format_keybind(const Keybind& kb) {
    std::string out;
    for (auto m : kb.modifiers) {
        out += to_string(m);
        out += '+';
    }
    out += kb.key;
    return out;
}

} // namespace mo
