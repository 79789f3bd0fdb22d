// FILE: src/cli/command/command_preset.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/presets.hpp"

namespace mo {

bool handle_preset(std::istringstream& iss, InteractionService& svc,
                   std::string& current_doc, CliConfig& /*config*/) {
  std::string arg;
  iss >> arg;
  if (arg.empty()) {
    for (const auto& name : hud_preset_names()) {
      HudPreset p = parse_hud_preset(name);
      if (p == HudPreset::Default) continue;
      std::cout << "  " << name << ": " << preset_title(p) << "\n";
    }
    return true;
  }
  if (!require_document(current_doc)) return true;
  HudPreset preset = parse_hud_preset(arg);
  if (preset == HudPreset::Default) {
    std::cout << "Preset -1 means no preset; nothing to apply.\n";
    return true;
  }
  if (!svc.cmd_apply_preset(current_doc, preset)) {
    print_last_error(svc, current_doc, "preset failed");
    return true;
  }
  std::cout << "Applied preset " << arg << " (" << preset_title(preset) << ") to '"
            << current_doc << "'. Values you had set still win.\n";
  return true;
}

void print_help_preset(const CliConfig& /*config*/) {
  print_help_from_file("help_preset.txt");
}

}  // namespace mo
