#pragma once

#include <sstream>
#include <string>

#include "kernel/interaction.hpp"

namespace mo {

// Prints "No current document..." and returns false when none is selected.
bool require_document(const std::string& current_doc);

// Prints the kernel's last error for `doc` after a failed call.
void print_last_error(const InteractionService& svc, const std::string& doc,
                      const std::string& fallback);

// Remaining text of the stream with surrounding whitespace removed and one
// pair of enclosing double quotes stripped.
std::string rest_of_line(std::istringstream& iss);

} // namespace mo
