#include "cli/command/command_utils.hpp"

#include <iostream>

#include "hud/value_codec.hpp"

namespace mo {

bool require_document(const std::string& current_doc) {
    if (current_doc.empty()) {
        std::cout << "No current document. Use open/new/switch.\n";
        return false;
    }
    return true;
}

void print_last_error(const InteractionService& svc, const std::string& doc,
                      const std::string& fallback) {
    auto err = svc.cmd_last_error(doc);
    std::cout << "Error: " << (err ? err->message : fallback) << "\n";
}

std::string rest_of_line(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    rest = trim(rest);
    if (rest.size() >= 2 && rest.front() == '"' && rest.back() == '"') {
        rest = rest.substr(1, rest.size() - 2);
    }
    return rest;
}

} // namespace mo
