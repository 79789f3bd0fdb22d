#include "cli/cli_autocompleter.hpp"

namespace mo {

// Whitespace split that keeps double-quoted text together.
std::vector<std::string> CliAutocompleter::Tokenize(const std::string& line) const {
    std::vector<std::string> tokens;
    std::string token;
    bool in_quotes = false;
    bool have_token = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
        } else if ((c == ' ' || c == '\t') && !in_quotes) {
            if (have_token) tokens.push_back(token);
            token.clear();
            have_token = false;
        } else {
            token += c;
            have_token = true;
        }
    }
    if (have_token) tokens.push_back(token);
    return tokens;
}

} // namespace mo
