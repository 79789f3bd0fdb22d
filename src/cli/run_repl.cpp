// FILE: src/cli/run_repl.cpp
#include <algorithm>
#include <iostream>
#include <vector>
#include <string>

#include "cli/run_repl.hpp"
#include "cli/terminal_input.hpp"
#include "cli_history.hpp"
#include "cli/cli_autocompleter.hpp"
#include "input_match_state.hpp"
#include "cli/process_command.hpp"

namespace mo {

namespace {

const char* kPrompt = "mo> ";
const int kPromptWidth = 4;

// Piped input: one command per line, no line editing.
void run_line_mode(InteractionService& svc, CliConfig& config, std::string& current_doc) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!process_command(line, svc, current_doc, config)) return;
    }
}

} // namespace

void run_repl(InteractionService& svc, CliConfig& config, const std::string& initial_doc) {
    std::string current_doc = initial_doc;

    TerminalInput term_input;
    if (!term_input.IsTerminal()) {
        run_line_mode(svc, config, current_doc);
        return;
    }

    CliHistory history;
    history.SetMaxSize(static_cast<size_t>(std::max(0, config.history_size)));
    CliAutocompleter completer(svc);
    completer.SetCurrentDocument(current_doc);

    struct CompletionState {
        std::vector<std::string> options;
        int current_index = -1;
        size_t original_cursor_pos = 0;
        std::string original_prefix;
        void Reset() { options.clear(); current_index = -1; }
        bool IsActive() const { return current_index != -1; }
    } completion_state;

    std::string line_buffer;
    int cursor_pos = 0;
    InputMatchState history_match_state;

    auto redraw_line = [&]() {
        std::cout << "\r\x1B[K" << kPrompt;
        if (completion_state.IsActive()) {
            // Highlight the completed word
            size_t start_idx = 0;
            if (completion_state.original_cursor_pos >= completion_state.original_prefix.length())
                start_idx = completion_state.original_cursor_pos - completion_state.original_prefix.length();
            size_t left_len = std::min(start_idx, line_buffer.size());
            size_t mid_len = (size_t)cursor_pos > left_len ? (size_t)cursor_pos - left_len : 0;
            std::cout << line_buffer.substr(0, left_len)
                      << "\x1B[7m" << line_buffer.substr(left_len, mid_len) << "\x1B[0m"
                      << line_buffer.substr(left_len + mid_len);
        } else {
            std::cout << line_buffer;
        }
        std::cout << "\r\x1B[" << (kPromptWidth + cursor_pos) << "C" << std::flush;
    };

    auto reset_line = [&]() {
        line_buffer.clear();
        cursor_pos = 0;
        history.ResetNavigation();
        history_match_state.Reset();
    };

    // Runs a command with the terminal in cooked mode. Returns false to exit.
    auto run_command = [&](const std::string& line) {
        term_input.Restore();
        bool continue_repl = process_command(line, svc, current_doc, config);
        completer.SetCurrentDocument(current_doc);
        term_input.SetRaw();
        return continue_repl;
    };

    std::cout << "mangoverlay: MangoHud config shell. Type 'help' for commands.\r\n";
    std::cout << "History file: " << history.Path().string() << "\r\n";
    if (!current_doc.empty()) std::cout << "Current document: " << current_doc << "\r\n";
    redraw_line();

    while (true) {
        int key = term_input.GetChar();
        if (key != TAB) {
            completion_state.Reset();
        }
        switch (key) {
            case ENTER: {
                std::cout << "\r\n";
                if (!line_buffer.empty()) {
                    history.Add(line_buffer);
                    history.Save();
                }
                if (!run_command(line_buffer)) return;
                reset_line();
                redraw_line();
                break;
            }
            case CTRL_C: {
                if (line_buffer.empty()) {
                    std::cout << "\r\n(To exit, type 'exit' or press Ctrl+C again on an empty line)\r\n";
                    redraw_line();
                    if (term_input.GetChar() == CTRL_C) {
                        std::cout << "\r\n";
                        if (!run_command("exit")) return;
                    }
                }
                reset_line();
                redraw_line();
                break;
            }
            case CTRL_D: {
                if (line_buffer.empty()) {
                    std::cout << "\r\n";
                    if (!run_command("exit")) return;
                    redraw_line();
                }
                break;
            }
            case BACKSPACE: {
                if (cursor_pos > 0) {
                    line_buffer.erase(cursor_pos - 1, 1);
                    cursor_pos--;
                    history_match_state.Reset();
                    redraw_line();
                }
                break;
            }
            case DEL: {
                if (cursor_pos < (int)line_buffer.length()) {
                    line_buffer.erase(cursor_pos, 1);
                    history_match_state.Reset();
                    redraw_line();
                }
                break;
            }
            case UP:
            case DOWN: {
                // The prefix typed before the first Up/Down stays the filter
                if (!history_match_state.active) {
                    history_match_state.Begin(line_buffer.substr(0, cursor_pos), cursor_pos);
                }
                const std::string& sticky = history_match_state.original_prefix;
                line_buffer = key == UP ? history.GetPrevious(sticky) : history.GetNext(sticky);
                cursor_pos = (int)line_buffer.length();
                redraw_line();
                break;
            }
            case LEFT:
            case RIGHT:
            case HOME:
            case END: {
                int target = cursor_pos;
                if (key == LEFT) target = std::max(0, cursor_pos - 1);
                if (key == RIGHT) target = std::min((int)line_buffer.length(), cursor_pos + 1);
                if (key == HOME) target = 0;
                if (key == END) target = (int)line_buffer.length();
                if (target != cursor_pos) {
                    cursor_pos = target;
                    history_match_state.Reset();
                    redraw_line();
                }
                break;
            }
            case TAB: {
                if (completion_state.IsActive()) {
                    // Cycle through the options of the last completion
                    completion_state.current_index = (completion_state.current_index + 1) % (int)completion_state.options.size();
                    size_t token_start = completion_state.original_cursor_pos - completion_state.original_prefix.length();
                    line_buffer.erase(token_start, (size_t)cursor_pos - token_start);
                    const std::string& opt = completion_state.options[completion_state.current_index];
                    line_buffer.insert(token_start, opt);
                    cursor_pos = (int)(token_start + opt.size());
                    redraw_line();
                } else {
                    auto result = completer.Complete(line_buffer, cursor_pos);
                    if (result.options.empty()) break;
                    if (result.options.size() > 1) {
                        std::cout << "\r\n";
                        for (const auto& o : result.options) std::cout << o << "  ";
                        std::cout << "\r\n";
                        completion_state.options = result.options;
                        completion_state.current_index = 0;
                        size_t start = cursor_pos > 0 ? line_buffer.find_last_of(" \t", cursor_pos - 1) : std::string::npos;
                        start = (start == std::string::npos) ? 0 : start + 1;
                        completion_state.original_prefix = line_buffer.substr(start, cursor_pos - (int)start);
                        completion_state.original_cursor_pos = cursor_pos;
                    }
                    line_buffer = result.new_line;
                    cursor_pos = result.new_cursor_pos;
                    redraw_line();
                }
                break;
            }
            case UNKNOWN:
            case ESC:
                break;
            default: {
                if (key >= 32 && key <= 126) {
                    line_buffer.insert(cursor_pos, 1, static_cast<char>(key));
                    cursor_pos++;
                    history.ResetNavigation();
                    history_match_state.Reset();
                    redraw_line();
                }
                break;
            }
        }
    }
}

} // namespace mo
