// Draw-order bookkeeping for configs with legacy_layout off.
#pragma once

#include <string>

#include "hud/overlay_config.hpp"

namespace mo {

bool is_orderable(const std::string& key);
bool is_repeatable(const std::string& key);

// Mirror the current value of `key` into the layout. Repeatable keys update
// their last entry; other keys update their entry in place. Appends when the
// key has no entry yet. No-op for keys that are not orderable.
void layout_sync(OverlayConfig& config, const std::string& key);

// Append a new entry and assign the field. Throws ConfigError for keys that
// are not orderable or values that do not parse.
void layout_add(OverlayConfig& config, const std::string& key, const std::string& value);

// Remove entry `index`. The field falls back to the last remaining entry for
// that key or to its default.
void layout_remove(OverlayConfig& config, size_t index);

// Move entry `index` by `delta` positions, clamped to the list. Returns the
// new index.
size_t layout_move(OverlayConfig& config, size_t index, int delta);

// Append entries for enabled orderable elements that have none, in table
// order. Used when legacy_layout is switched off.
void layout_rebuild(OverlayConfig& config);

// set_value/reset_value that keep the draw order in step: switching
// legacy_layout off seeds the layout, switching it on clears it, and other
// orderable keys are mirrored with layout_sync (or dropped on reset).
void assign_param(OverlayConfig& config, const std::string& key, const std::string& value);
void restore_param(OverlayConfig& config, const std::string& key);

} // namespace mo
