// FILE: src/cli/command/command_show.cpp
#include <algorithm>
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/param_registry.hpp"
#include "hud/value_codec.hpp"

namespace mo {

namespace {

// Section name matched without regard to case ("core visual").
std::string match_section(const std::string& text) {
  const std::string wanted = to_lower(text);
  for (const auto& s : sections()) {
    if (to_lower(s) == wanted) return s;
  }
  return "";
}

}  // namespace

bool handle_show(std::istringstream& iss, InteractionService& svc,
                 std::string& current_doc, CliConfig& config) {
  if (!require_document(current_doc)) return true;
  std::string arg = rest_of_line(iss);
  if (arg.empty()) arg = config.show_defaults ? "all" : "changed";

  if (arg == "changed" || arg == "all") {
    auto text = svc.cmd_render(current_doc, arg == "all" ? WriteMode::Full : WriteMode::Minimal);
    if (!text) {
      print_last_error(svc, current_doc, "render failed");
      return true;
    }
    std::cout << *text;
    return true;
  }

  const std::string section = match_section(arg);
  if (section.empty()) {
    std::cout << "Unknown section '" << arg << "'. Sections:";
    for (const auto& s : sections()) std::cout << " [" << s << "]";
    std::cout << "\n";
    return true;
  }
  auto rows = svc.cmd_params(current_doc, false, section);
  if (!rows) {
    print_last_error(svc, current_doc, "listing failed");
    return true;
  }
  std::cout << "### " << section << "\n";
  for (const auto& r : *rows) {
    if (!r.is_set) continue;
    std::cout << (r.is_default ? "  " : "* ") << r.key << "=" << r.value << "\n";
  }
  return true;
}

void print_help_show(const CliConfig& /*config*/) {
  print_help_from_file("help_show.txt");
}

}  // namespace mo
