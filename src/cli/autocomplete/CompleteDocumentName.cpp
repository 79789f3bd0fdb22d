#include "cli/cli_autocompleter.hpp"
#include "kernel/interaction.hpp"

namespace mo {

void CliAutocompleter::CompleteDocumentName(const std::string& prefix, std::vector<std::string>& options) const {
    for (const auto& n : svc_.cmd_list_documents()) {
        if (n.rfind(prefix, 0) == 0) options.push_back(n);
    }
}

} // namespace mo
