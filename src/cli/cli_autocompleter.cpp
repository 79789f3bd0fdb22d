#include "cli/cli_autocompleter.hpp"

#include <algorithm>

#include "kernel/interaction.hpp"

namespace mo {

CliAutocompleter::CliAutocompleter(mo::InteractionService& svc) : svc_(svc) {
  // This list should be kept in sync with commands in `process_command`
  commands_ = {"clear",  "cls",    "close",  "config",   "diff",   "docs",
               "edit",   "env",    "exit",   "export",   "get",    "help",
               "layout", "new",    "open",   "params",   "preset", "q",
               "quit",   "reset",  "save",   "set",      "show",   "source",
               "switch", "validate"};
  std::sort(commands_.begin(), commands_.end());
}

CompletionResult CliAutocompleter::Complete(const std::string& line,
                                            int cursor_pos) {
  CompletionResult result;
  result.new_line = line;
  result.new_cursor_pos = cursor_pos;

  // Find the word to complete based on cursor position
  size_t start_of_word = 0;
  if (cursor_pos > 0) {
    auto pos = line.find_last_of(" \t", cursor_pos - 1);
    start_of_word = (pos == std::string::npos) ? 0 : pos + 1;
  }
  std::string prefix = line.substr(start_of_word, cursor_pos - start_of_word);

  // Tokens before the word being completed give the context
  std::vector<std::string> tokens = Tokenize(line.substr(0, start_of_word));

  if (tokens.empty()) {
    CompleteCommand(prefix, result.options);
  } else {
    const std::string& cmd = tokens[0];
    const size_t arg_index = tokens.size();  // 1 = first argument
    if (cmd == "help") {
      if (arg_index == 1) CompleteCommand(prefix, result.options);
    } else if (cmd == "get" || cmd == "reset") {
      if (arg_index == 1) CompleteParamKey(prefix, result.options);
    } else if (cmd == "set") {
      if (arg_index == 1)
        CompleteParamKey(prefix, result.options);
      else if (arg_index == 2)
        CompleteParamValue(tokens[1], prefix, result.options);
    } else if (cmd == "open") {
      // open <name> <file>
      if (arg_index == 2) CompleteConfPath(prefix, result.options);
    } else if (cmd == "new") {
      if (arg_index == 2 && std::string("modern").rfind(prefix, 0) == 0)
        result.options.push_back("modern");
    } else if (cmd == "switch" || cmd == "close") {
      if (arg_index == 1) CompleteDocumentName(prefix, result.options);
    } else if (cmd == "diff") {
      if (arg_index <= 2) CompleteDocumentName(prefix, result.options);
    } else if (cmd == "show" || cmd == "params") {
      if (arg_index == 1) {
        if (cmd == "show") {
          for (const char* m : {"all", "changed"})
            if (std::string(m).rfind(prefix, 0) == 0) result.options.push_back(m);
        }
        CompleteSection(prefix, result.options);
      }
    } else if (cmd == "layout") {
      CompleteLayoutArgs(tokens, prefix, result.options);
    } else if (cmd == "preset") {
      if (arg_index == 1) {
        for (const char* p : {"0", "1", "2", "3", "4"})
          if (std::string(p).rfind(prefix, 0) == 0) result.options.push_back(p);
      }
    } else if (cmd == "save") {
      if (arg_index == 1)
        CompleteConfPath(prefix, result.options);
      else if (arg_index == 2) {
        for (const char* m : {"full", "minimal"})
          if (std::string(m).rfind(prefix, 0) == 0) result.options.push_back(m);
      }
    } else if (cmd == "export" || cmd == "source") {
      if (arg_index == 1) CompletePath(prefix, result.options);
    }
  }

  if (result.options.empty()) {
    return result;
  }

  std::string common_prefix = FindLongestCommonPrefix(result.options);
  if (common_prefix.empty()) {
    return result;
  }

  // Replace the partial word with the common prefix
  result.new_line =
      line.substr(0, start_of_word) + common_prefix + line.substr(cursor_pos);
  result.new_cursor_pos =
      static_cast<int>(start_of_word + common_prefix.length());

  // A single exact match gets a trailing space unless it is a directory
  if (result.options.size() == 1 && common_prefix == result.options[0] &&
      result.options[0].back() != '/') {
    result.new_line.insert(result.new_cursor_pos, " ");
    result.new_cursor_pos++;
  }

  return result;
}

}  // namespace mo
