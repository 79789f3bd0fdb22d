// FILE: src/cli/command/command_params.cpp
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/param_registry.hpp"
#include "hud/value_codec.hpp"

namespace mo {

// Lists the parameter table. With a current document the values come from
// it, otherwise from the defaults.
bool handle_params(std::istringstream& iss, InteractionService& svc,
                   std::string& current_doc, CliConfig& config) {
  const std::string wanted = to_lower(rest_of_line(iss));
  const OverlayConfig defaults = default_config();
  std::optional<OverlayConfig> snapshot;
  if (!current_doc.empty()) snapshot = svc.cmd_snapshot(current_doc);
  const OverlayConfig& cfg = snapshot ? *snapshot : defaults;

  bool any = false;
  for (const auto& section : sections()) {
    if (!wanted.empty() && to_lower(section) != wanted) continue;
    any = true;
    std::cout << "### " << section << "\n";
    for (const ParamSpec* p : params_in_section(section)) {
      const bool changed = !is_default(cfg, p->key);
      if (!config.show_defaults && wanted.empty() && snapshot && !changed) continue;
      std::cout << (changed ? "* " : "  ") << std::left << std::setw(32) << p->key
                << std::setw(12) << to_string(p->kind)
                << p->format(cfg).value_or("(unset)");
      if (!p->description.empty()) std::cout << "  # " << p->description;
      std::cout << "\n";
    }
  }
  if (!any) std::cout << "Unknown section '" << wanted << "'.\n";
  return true;
}

void print_help_params(const CliConfig& /*config*/) {
  print_help_from_file("help_params.txt");
}

}  // namespace mo
