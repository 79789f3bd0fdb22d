#include "cli/cli_autocompleter.hpp"
#include "hud/param_registry.hpp"

namespace mo {

void CliAutocompleter::CompleteParamKey(const std::string& prefix, std::vector<std::string>& options) const {
    for (const auto& p : all_params()) {
        if (p.key.rfind(prefix, 0) == 0) options.push_back(p.key);
    }
}

} // namespace mo
