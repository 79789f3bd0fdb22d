#include "cli/cli_autocompleter.hpp"
#include "hud/param_registry.hpp"
#include "kernel/interaction.hpp"

#include <algorithm>

namespace mo {

void CliAutocompleter::CompleteParamValue(const std::string& key, const std::string& prefix,
                                          std::vector<std::string>& options) const {
    const ParamSpec* spec = find_param(key);
    if (!spec) return;
    if (spec->kind == ParamKind::Bool) {
        for (const char* v : {"0", "1"}) options.push_back(v);
    } else if (spec->choices) {
        options = *spec->choices;
    } else if (!current_doc_.empty()) {
        auto current = svc_.cmd_get(current_doc_, key);
        if (current && !current->empty()) options.push_back(*current);
    } else {
        return;
    }
    options.erase(std::remove_if(options.begin(), options.end(),
                                 [&](const std::string& o) { return o.rfind(prefix, 0) != 0; }),
                  options.end());
}

} // namespace mo
