#pragma once
#include <string>
#include <vector>

namespace mo { class InteractionService; }

namespace mo {

struct CompletionResult {
    std::vector<std::string> options;
    std::string new_line;
    int new_cursor_pos;
};

class CliAutocompleter {
public:
    // Build a completer bound to the backend interaction layer.
    explicit CliAutocompleter(mo::InteractionService& svc);

    // Current document, used for value completions that depend on its state.
    void SetCurrentDocument(const std::string& doc_name) { current_doc_ = doc_name; }

    CompletionResult Complete(const std::string& line, int cursor_pos);

    const std::vector<std::string>& Commands() const { return commands_; }

private:
    std::vector<std::string> Tokenize(const std::string& line) const;
    std::string FindLongestCommonPrefix(const std::vector<std::string>& options) const;

    // Completion providers
    void CompleteCommand(const std::string& prefix, std::vector<std::string>& options) const;
    void CompletePath(const std::string& prefix, std::vector<std::string>& options) const;
    // Only *.conf files (directories stay so traversal can continue).
    void CompleteConfPath(const std::string& prefix, std::vector<std::string>& options) const;
    void CompleteDocumentName(const std::string& prefix, std::vector<std::string>& options) const;
    void CompleteParamKey(const std::string& prefix, std::vector<std::string>& options) const;
    // Enum choices, 0/1 for toggles, the current value otherwise.
    void CompleteParamValue(const std::string& key, const std::string& prefix,
                            std::vector<std::string>& options) const;
    void CompleteSection(const std::string& prefix, std::vector<std::string>& options) const;
    void CompleteLayoutArgs(const std::vector<std::string>& tokens, const std::string& prefix,
                            std::vector<std::string>& options) const;

    mo::InteractionService& svc_;
    std::string current_doc_;
    std::vector<std::string> commands_;
};

} // namespace mo
