// FILE: src/cli/command/command_layout.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/param_registry.hpp"
#include "hud/value_codec.hpp"

namespace mo {

namespace {

void print_layout(InteractionService& svc, const std::string& doc) {
  auto entries = svc.cmd_layout(doc);
  if (!entries) {
    print_last_error(svc, doc, "no layout");
    return;
  }
  if (svc.cmd_get(doc, "legacy_layout").value_or("1") == "1") {
    std::cout << "legacy_layout is on: MangoHud uses its built-in element order.\n"
              << "Run 'set legacy_layout 0' to order elements yourself.\n";
    return;
  }
  if (entries->empty()) {
    std::cout << "(layout is empty: no HUD elements will be drawn)\n";
    return;
  }
  for (size_t i = 0; i < entries->size(); ++i) {
    const auto& e = (*entries)[i];
    std::cout << "  " << i << ": " << e.key;
    if (!e.value.empty()) std::cout << "=" << e.value;
    std::cout << "\n";
  }
}

size_t read_index(std::istringstream& iss) {
  std::string text;
  iss >> text;
  return static_cast<size_t>(parse_int(text, 0, 100000));
}

}  // namespace

bool handle_layout(std::istringstream& iss, InteractionService& svc,
                   std::string& current_doc, CliConfig& /*config*/) {
  if (!require_document(current_doc)) return true;
  std::string sub;
  iss >> sub;
  if (sub.empty() || sub == "list") {
    print_layout(svc, current_doc);
    return true;
  }

  if (sub == "up" || sub == "down") {
    const size_t index = read_index(iss);
    std::string steps_text;
    iss >> steps_text;
    int steps = steps_text.empty() ? 1 : static_cast<int>(parse_int(steps_text, 1, 100000));
    auto moved = svc.cmd_layout_move(current_doc, index, sub == "up" ? -steps : steps);
    if (!moved) {
      print_last_error(svc, current_doc, "move failed");
      return true;
    }
  } else if (sub == "rm" || sub == "remove") {
    if (!svc.cmd_layout_remove(current_doc, read_index(iss))) {
      print_last_error(svc, current_doc, "remove failed");
      return true;
    }
  } else if (sub == "add") {
    std::string key;
    iss >> key;
    std::string value = rest_of_line(iss);
    if (key.empty()) {
      std::cout << "Usage: layout add <key> [value]\n";
      return true;
    }
    const ParamSpec* spec = find_param(key);
    if (value.empty() && spec && spec->kind == ParamKind::Bool) value = "1";
    if (!svc.cmd_layout_add(current_doc, key, value)) {
      print_last_error(svc, current_doc, "add failed");
      return true;
    }
  } else {
    std::cout << "Usage: layout [up|down <i> [n] | rm <i> | add <key> [value]]\n";
    return true;
  }
  print_layout(svc, current_doc);
  return true;
}

void print_help_layout(const CliConfig& /*config*/) {
  print_help_from_file("help_layout.txt");
}

}  // namespace mo
