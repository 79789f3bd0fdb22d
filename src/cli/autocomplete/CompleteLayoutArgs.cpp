#include "cli/cli_autocompleter.hpp"
#include "hud/layout.hpp"
#include "hud/param_registry.hpp"

namespace mo {

void CliAutocompleter::CompleteLayoutArgs(const std::vector<std::string>& tokens, const std::string& prefix,
                                          std::vector<std::string>& options) const {
    if (tokens.size() == 1) {
        for (const char* sub : {"add", "down", "rm", "up"}) {
            if (std::string(sub).rfind(prefix, 0) == 0) options.push_back(sub);
        }
        return;
    }
    // layout add <key> [value]
    if (tokens.size() == 2 && tokens[1] == "add") {
        for (const auto& p : all_params()) {
            if (p.orderable && p.key.rfind(prefix, 0) == 0) options.push_back(p.key);
        }
    }
}

} // namespace mo
