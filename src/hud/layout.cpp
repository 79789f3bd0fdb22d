#include "hud/layout.hpp"

#include <algorithm>

#include "hud/param_registry.hpp"
#include "mo_types.hpp"

namespace mo {

bool is_orderable(const std::string& key) {
    const ParamSpec* spec = find_param(key);
    return spec && spec->orderable;
}

bool is_repeatable(const std::string& key) {
    const ParamSpec* spec = find_param(key);
    return spec && spec->repeatable;
}

void layout_sync(OverlayConfig& config, const std::string& key) {
    if (!is_orderable(key)) return;
    auto value = get_value(config, key).value_or("");
    auto& layout = config.layout;
    auto it = std::find_if(layout.rbegin(), layout.rend(), [&](const LayoutEntry& e) { return e.key == key; });
    if (it != layout.rend()) {
        it->value = value;
        return;
    }
    layout.push_back({key, value});
}

void layout_add(OverlayConfig& config, const std::string& key, const std::string& value) {
    const ParamSpec* spec = find_param(key);
    if (!spec) throw ConfigError(ConfigErrc::UnknownKey, "Unknown parameter '" + key + "'");
    if (!spec->orderable) {
        throw ConfigError(ConfigErrc::InvalidValue, "'" + key + "' is not a HUD element and cannot be placed in the layout");
    }
    set_value(config, key, value);
    config.layout.push_back({key, get_value(config, key).value_or("")});
}

void layout_remove(OverlayConfig& config, size_t index) {
    auto& layout = config.layout;
    if (index >= layout.size()) {
        throw ConfigError(ConfigErrc::NotFound, "Layout index " + std::to_string(index) + " out of range");
    }
    const std::string key = layout[index].key;
    layout.erase(layout.begin() + static_cast<long>(index));

    reset_value(config, key);
    auto it = std::find_if(layout.rbegin(), layout.rend(), [&](const LayoutEntry& e) { return e.key == key; });
    if (it != layout.rend()) set_value(config, key, it->value);
}

size_t layout_move(OverlayConfig& config, size_t index, int delta) {
    auto& layout = config.layout;
    if (index >= layout.size()) {
        throw ConfigError(ConfigErrc::NotFound, "Layout index " + std::to_string(index) + " out of range");
    }
    long target = static_cast<long>(index) + delta;
    target = std::max(0L, std::min(target, static_cast<long>(layout.size()) - 1));
    auto entry = layout[index];
    layout.erase(layout.begin() + static_cast<long>(index));
    layout.insert(layout.begin() + target, entry);
    return static_cast<size_t>(target);
}

void layout_rebuild(OverlayConfig& config) {
    for (const auto& p : all_params()) {
        if (!p.orderable) continue;
        bool present = std::any_of(config.layout.begin(), config.layout.end(),
                                   [&](const LayoutEntry& e) { return e.key == p.key; });
        if (present) continue;
        auto value = p.format(config).value_or("");
        bool enabled = p.kind == ParamKind::Bool ? value == "1" : !value.empty();
        if (enabled) config.layout.push_back({p.key, value});
    }
}

void assign_param(OverlayConfig& config, const std::string& key, const std::string& value) {
    if (key == "legacy_layout") {
        const bool was_legacy = config.legacy_layout;
        set_value(config, key, value);
        if (was_legacy && !config.legacy_layout) layout_rebuild(config);
        if (!was_legacy && config.legacy_layout) config.layout.clear();
        return;
    }
    set_value(config, key, value);
    if (!config.legacy_layout) layout_sync(config, key);
}

void restore_param(OverlayConfig& config, const std::string& key) {
    reset_value(config, key);
    if (key == "legacy_layout") {
        config.layout.clear();
    } else if (!config.legacy_layout && is_orderable(key)) {
        auto& layout = config.layout;
        layout.erase(std::remove_if(layout.begin(), layout.end(), [&](const LayoutEntry& e) { return e.key == key; }),
                     layout.end());
    }
}

} // namespace mo
