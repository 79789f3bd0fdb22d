#pragma once

#include <string>
#include <vector>

namespace mo {

// Filesystem completions for `prefix`. Suggestions keep the typed directory
// part, a leading "~/" is expanded for lookup but kept in the suggestion, and
// directories get a trailing '/'. Config files (*.conf) are listed first.
std::vector<std::string> PathCompleteOptions(const std::string& prefix);

// Longest common prefix of the options ("" when empty).
std::string LongestCommonPrefix(const std::vector<std::string>& options);

} // namespace mo
