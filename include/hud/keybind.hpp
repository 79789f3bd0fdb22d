#pragma once
#include <string>
#include <vector>

namespace mo {

enum class KeyModifier {
    ShiftL, ShiftR, ControlL, ControlR, AltL, AltR, SuperL, SuperR,
};

const char* to_string(KeyModifier m);

// A MangoHud key binding such as "Shift_R+F12". Left and right modifiers are
// distinct.
struct Keybind {
    std::vector<KeyModifier> modifiers;
    std::string key; // X11 keysym name, e.g. "F12", "Home", "a"

    bool empty() const { return key.empty(); }
};

inline bool operator==(const Keybind& a, const Keybind& b) {
    return a.modifiers == b.modifiers && a.key == b.key;
}
inline bool operator!=(const Keybind& a, const Keybind& b) { return !(a == b); }

// Throws ConfigError(InvalidValue) for malformed bindings.
Keybind parse_keybind(const std::string& text);
std::string format_keybind(const Keybind& kb);

// True for names MangoHud can bind: F1-F24, single letters/digits and the
// named navigation/keypad keys.
bool is_known_key_name(const std::string& name);

} // namespace mo
