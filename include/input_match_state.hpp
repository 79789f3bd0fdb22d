#pragma once

#include <string>

namespace mo {

// Sticky prefix kept while cycling history (Up/Down) or completions (Tab).
// Editing the line or moving the cursor calls Reset().
struct InputMatchState {
    bool active = false;
    std::string original_prefix;
    size_t original_cursor_pos = 0;

    void Begin(const std::string& prefix, size_t cursor_pos) {
        active = true;
        original_prefix = prefix;
        original_cursor_pos = cursor_pos;
    }

    void Reset() {
        active = false;
        original_prefix.clear();
        original_cursor_pos = 0;
    }
};

} // namespace mo
