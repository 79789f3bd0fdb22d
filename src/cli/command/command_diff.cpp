// FILE: src/cli/command/command_diff.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_diff(std::istringstream& iss, InteractionService& svc,
                 std::string& current_doc, CliConfig& /*config*/) {
  std::string left, right;
  iss >> left >> right;
  if (left.empty()) {
    std::cout << "Usage: diff <a> [b]\n";
    return true;
  }
  // One name compares the current document against it
  if (right.empty()) {
    if (!require_document(current_doc)) return true;
    right = left;
    left = current_doc;
  }
  auto entries = svc.cmd_diff(left, right);
  if (!entries) {
    print_last_error(svc, svc.cmd_has_document(left) ? right : left, "diff failed");
    return true;
  }
  if (entries->empty()) {
    std::cout << "'" << left << "' and '" << right << "' are identical.\n";
    return true;
  }
  std::cout << "--- " << left << "\n+++ " << right << "\n";
  for (const auto& e : *entries) {
    std::cout << "  " << e.key << ": " << e.left << " -> " << e.right << "\n";
  }
  return true;
}

void print_help_diff(const CliConfig& /*config*/) {
  print_help_from_file("help_diff.txt");
}

}  // namespace mo
