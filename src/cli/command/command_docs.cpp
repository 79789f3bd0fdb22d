// FILE: src/cli/command/command_docs.cpp
#include <iostream>
#include <sstream>
#include <vector>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_docs(std::istringstream& /*iss*/, InteractionService& svc,
                 std::string& current_doc, CliConfig& /*config*/) {
  auto names = svc.cmd_list_documents();
  if (names.empty()) {
    std::cout << "(no documents open)\n";
    return true;
  }
  std::cout << "Open documents:" << std::endl;
  for (auto& n : names) {
    auto path = svc.cmd_document_path(n);
    std::cout << "  - " << n;
    if (svc.cmd_is_dirty(n).value_or(false)) std::cout << " *";
    std::cout << "  (" << (path && !path->empty() ? path->string() : "unsaved") << ")";
    if (n == current_doc) std::cout << "  [current]";
    std::cout << std::endl;
  }
  return true;
}

void print_help_docs(const CliConfig& /*config*/) {
  print_help_from_file("help_docs.txt");
}

}  // namespace mo
