#include "cli/cli_autocompleter.hpp"
#include "hud/param_registry.hpp"

namespace mo {

// Multi-word sections ("Core Visual") are left out; the shell splits on spaces.
void CliAutocompleter::CompleteSection(const std::string& prefix, std::vector<std::string>& options) const {
    for (const auto& s : sections()) {
        if (s.find(' ') != std::string::npos) continue;
        if (s.rfind(prefix, 0) == 0) options.push_back(s);
    }
}

} // namespace mo
