// FILE: src/cli/command/command_validate.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_validate(std::istringstream& /*iss*/, InteractionService& svc,
                     std::string& current_doc, CliConfig& /*config*/) {
  if (!require_document(current_doc)) return true;
  auto diags = svc.cmd_diagnostics(current_doc);
  auto issues = svc.cmd_validate(current_doc);
  if (!issues) {
    print_last_error(svc, current_doc, "validation failed");
    return true;
  }
  size_t errors = 0, warnings = 0;
  if (diags) {
    for (const auto& d : *diags) {
      std::cout << "  " << to_string(d.severity) << ": line " << d.line << ": " << d.message << "\n";
      if (d.severity == Severity::Error) ++errors;
      if (d.severity == Severity::Warning) ++warnings;
    }
  }
  for (const auto& i : *issues) {
    std::cout << "  " << to_string(i.severity) << ": " << i.key << ": " << i.message << "\n";
    if (i.severity == Severity::Error) ++errors;
    if (i.severity == Severity::Warning) ++warnings;
  }
  if (errors == 0 && warnings == 0)
    std::cout << "'" << current_doc << "' looks good.\n";
  else
    std::cout << errors << " error(s), " << warnings << " warning(s).\n";
  return true;
}

void print_help_validate(const CliConfig& /*config*/) {
  print_help_from_file("help_validate.txt");
}

}  // namespace mo
