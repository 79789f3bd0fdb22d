#include "cli/cli_autocompleter.hpp"
#include "cli/path_complete.hpp"

namespace mo {

void CliAutocompleter::CompleteConfPath(
    const std::string& prefix, std::vector<std::string>& options) const {
  for (const auto& o : PathCompleteOptions(prefix)) {
    if (!o.empty() && o.back() == '/') {
      options.push_back(o);  // allow continuing into subdirectories
    } else if (o.size() >= 5 && o.compare(o.size() - 5, 5, ".conf") == 0) {
      options.push_back(o);
    }
  }
}

}  // namespace mo
