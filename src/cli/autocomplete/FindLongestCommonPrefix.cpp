#include "cli/cli_autocompleter.hpp"
#include "cli/path_complete.hpp"

namespace mo {

std::string CliAutocompleter::FindLongestCommonPrefix(const std::vector<std::string>& options) const {
    return LongestCommonPrefix(options);
}

} // namespace mo
