#pragma once
#include <string>

namespace mo {

// Prompt on stdout and read one line; empty input yields `def`.
std::string ask(const std::string& q, const std::string& def);

} // namespace mo
