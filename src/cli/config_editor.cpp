// Front-end only: TUI editor for the mangoverlay settings file
#include "cli/config_editor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "cli/ask.hpp"
#include "cli/ask_yesno.hpp"
#include "cli/path_complete.hpp"
#include "cli/tui_editor.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/dom/elements.hpp"
#include "hud/value_codec.hpp"
#include "mo_types.hpp"

using namespace ftxui;

namespace mo {

namespace {

class ConfigEditor : public TuiEditor {
    struct EditableLine {
        std::string label;
        std::string* value_ptr = nullptr;
        bool is_radio = false;
        std::vector<std::string>* radio_options = nullptr;
        int* radio_selected_idx = nullptr;
        bool is_toggle = false;
        bool* toggle_ptr = nullptr;
        bool is_path = false;
    };
public:
    bool changes_applied = false;
    ConfigEditor(ScreenInteractive& screen, CliConfig& config)
        : TuiEditor(screen), original_config_(config), temp_config_(config) {
        InputOption opt; opt.on_enter = [this]{ CommitEdit(); };
        editor_input_ = Input(&edit_buffer_, "...", opt);
        radio_editor_ = Radiobox(&dummy_radio_options_, &dummy_radio_selected_idx_);
        SyncModelToUiState();
        RebuildLineView();
    }
    void Run() override {
        auto main_container = Container::Vertical({});
        auto component = Renderer(main_container, [&] {
            Elements line_elements;
            for (size_t i = 0; i < editable_lines_.size(); ++i) {
                auto& line = editable_lines_[i];
                Element display_element;
                if (mode_ == Mode::Edit && selected_ == (int)i && !line.is_toggle) {
                    display_element = line.is_radio ? radio_editor_->Render() : editor_input_->Render();
                } else if (line.is_radio) {
                    display_element = text((*line.radio_options)[*line.radio_selected_idx]);
                } else if (line.is_toggle) {
                    display_element = text((*line.toggle_ptr) ? "[x]" : "[ ]");
                } else {
                    display_element = line.value_ptr->empty() ? text("(none)") | dim : text(*line.value_ptr);
                }
                auto content = hbox({ text(line.label) | size(WIDTH, EQUAL, 28), display_element | flex });
                if (selected_ == (int)i) content |= inverted;
                line_elements.push_back(content);
            }
            return vbox({ text("Mangoverlay Settings") | bold | hcenter,
                         separator(), vbox(std::move(line_elements)) | vscroll_indicator | frame | flex,
                         separator(), RenderStatusBar() });
        });
        component |= CatchEvent([&](Event event) {
            if (mode_ == Mode::Command) {
                if (event == Event::Return) { ExecuteCommand(); return true; }
                if (event == Event::Escape) { mode_ = Mode::Navigate; command_buffer_.clear(); return true; }
                if (event.is_character()) { command_buffer_ += event.character(); return true; }
                if (event == Event::Backspace && !command_buffer_.empty()) { command_buffer_.pop_back(); return true; }
                return false;
            }
            if (mode_ == Mode::Edit) {
                if (event == Event::Escape) { mode_ = Mode::Navigate; return true; }
                if (event == Event::Return) { CommitEdit(); return true; }
                if (editable_lines_[selected_].is_radio) return radio_editor_->OnEvent(event);
                if (event == Event::Tab && editable_lines_[selected_].is_path) {
                    auto options = PathCompleteOptions(edit_buffer_);
                    auto common = LongestCommonPrefix(options);
                    if (!common.empty()) edit_buffer_ = common;
                    return true;
                }
                return editor_input_->OnEvent(event);
            }
            if (event == Event::Character('e') || event == Event::Return) { EnterEditMode(); return true; }
            if (event == Event::Character('q')) { screen_.Exit(); return true; }
            if (event == Event::Character(':')) { mode_ = Mode::Command; return true; }
            if (event == Event::ArrowDown) { selected_ = std::min(selected_ + 1, (int)editable_lines_.size() - 1); return true; }
            if (event == Event::ArrowUp) { selected_ = std::max(selected_ - 1, 0); return true; }
            return false;
        });
        screen_.Loop(component);
    }

private:
    static int FindIndex(const std::vector<std::string>& v, const std::string& val) {
        auto it = std::find(v.begin(), v.end(), val);
        return it == v.end() ? 0 : (int)std::distance(v.begin(), it);
    }

    void SyncModelToUiState() {
        active_config_path_buffer_ = temp_config_.loaded_config_path;
        history_size_buffer_ = std::to_string(temp_config_.history_size);
        selected_write_mode_idx_ = FindIndex(write_mode_entries_, temp_config_.write_mode);
        selected_config_save_idx_ = FindIndex(config_save_entries_, temp_config_.config_save_behavior);
        selected_editor_save_idx_ = FindIndex(editor_save_entries_, temp_config_.editor_save_behavior);
    }

    // Returns false (and sets the status) when a text field does not parse.
    bool SyncUiStateToModel() {
        try {
            temp_config_.history_size = static_cast<int>(parse_int(history_size_buffer_, 0, 1000000));
        } catch (const ConfigError& e) {
            status_message_ = std::string("Error: history_size: ") + e.what();
            return false;
        }
        temp_config_.loaded_config_path = active_config_path_buffer_;
        temp_config_.write_mode = write_mode_entries_[selected_write_mode_idx_];
        temp_config_.config_save_behavior = config_save_entries_[selected_config_save_idx_];
        temp_config_.editor_save_behavior = editor_save_entries_[selected_editor_save_idx_];
        return true;
    }

    void RebuildLineView() {
        editable_lines_.clear();
        auto add_line = [&](const std::string& label, std::string* ptr, bool is_path = false) {
            EditableLine l; l.label = label; l.value_ptr = ptr; l.is_path = is_path; editable_lines_.push_back(l);
        };
        auto add_radio_line = [&](const std::string& label, std::vector<std::string>* opts, int* idx) {
            EditableLine l; l.label = label; l.is_radio = true; l.radio_options = opts; l.radio_selected_idx = idx; editable_lines_.push_back(l);
        };
        auto add_toggle_line = [&](const std::string& label, bool* ptr) {
            EditableLine l; l.label = label; l.is_toggle = true; l.toggle_ptr = ptr; editable_lines_.push_back(l);
        };

        add_line("active_config", &active_config_path_buffer_, true);
        add_line("history_size", &history_size_buffer_);
        add_radio_line("write_mode", &write_mode_entries_, &selected_write_mode_idx_);
        add_toggle_line("backup_on_save", &temp_config_.backup_on_save);
        add_radio_line("config_save_behavior", &config_save_entries_, &selected_config_save_idx_);
        add_radio_line("editor_save_behavior", &editor_save_entries_, &selected_editor_save_idx_);
        add_line("default_app", &temp_config_.default_app);
        add_toggle_line("show_defaults", &temp_config_.show_defaults);
        add_line("default_export_path", &temp_config_.default_export_path, true);
        add_toggle_line("exit_prompt_save", &temp_config_.exit_prompt_save);
    }
    void EnterEditMode() {
        if (selected_ >= (int)editable_lines_.size()) return;
        const auto& line = editable_lines_[selected_];
        if (line.is_toggle) { *line.toggle_ptr = !*line.toggle_ptr; return; }
        mode_ = Mode::Edit;
        if (line.is_radio) {
            RadioboxOption opt; opt.entries = line.radio_options; opt.selected = line.radio_selected_idx; opt.focused_entry = line.radio_selected_idx; radio_editor_ = Radiobox(opt); radio_editor_->TakeFocus();
        } else { edit_buffer_ = *line.value_ptr; editor_input_->TakeFocus(); }
    }
    void CommitEdit() {
        if (selected_ >= (int)editable_lines_.size()) return;
        const auto& line = editable_lines_[selected_];
        if (!line.is_radio && line.value_ptr) *line.value_ptr = edit_buffer_;
        mode_ = Mode::Navigate;
    }
    Element RenderStatusBar() {
        std::string help;
        if (mode_ == Mode::Navigate) help = "↑/↓:Move | e:Edit | q:Quit | ::Command";
        else if (mode_ == Mode::Edit) help = "Enter:Accept | Esc:Cancel | ↑/↓:Change";
        else { return hbox({ text(":" + command_buffer_), text(" ") | blink, filler(), text("[a]pply | [w]rite | [q]uit | Esc:Cancel") | dim, }) | inverted; }
        return hbox({ text(help) | dim, filler(), text(status_message_) | bold });
    }
    void ExecuteCommand() {
        std::string cmd = to_lower(trim(command_buffer_));
        command_buffer_.clear();
        mode_ = Mode::Navigate;
        if (cmd == "a" || cmd == "apply") {
            Apply();
        } else if (cmd == "w" || cmd == "write") {
            if (!Apply()) return;
            if (original_config_.loaded_config_path.empty()) { status_message_ = "Error: No settings file loaded. Set active_config and apply first."; return; }
            if (write_config_to_file(original_config_, original_config_.loaded_config_path)) status_message_ = "Changes applied and saved.";
            else status_message_ = "Error: failed to write file.";
        } else if (cmd == "q" || cmd == "quit") { screen_.Exit(); }
        else { status_message_ = "Error: Unknown command '" + cmd + "'"; }
    }
    // Copies the edited state into the live settings. A changed active_config
    // loads that file, or creates it from the current state when missing.
    bool Apply() {
        const std::string old_path = original_config_.loaded_config_path;
        const std::string new_path = active_config_path_buffer_;
        if (new_path != old_path && !new_path.empty() && fs::exists(new_path)) {
            load_or_create_config(new_path, original_config_);
            temp_config_ = original_config_;
            status_message_ = "Loaded settings from: " + new_path;
        } else {
            if (!SyncUiStateToModel()) return false;
            if (new_path != old_path && !new_path.empty()) {
                temp_config_.loaded_config_path = fs::absolute(new_path).string();
                if (!write_config_to_file(temp_config_, new_path)) { status_message_ = "Error creating file: " + new_path; return false; }
                status_message_ = "Created and applied new settings: " + new_path;
            } else {
                status_message_ = "Settings applied to current session.";
            }
            original_config_ = temp_config_;
        }
        SyncModelToUiState(); RebuildLineView();
        changes_applied = true;
        return true;
    }

    CliConfig& original_config_;
    CliConfig temp_config_;
    std::string status_message_ = "Ready";
    enum class Mode { Navigate, Edit, Command };
    Mode mode_ = Mode::Navigate;
    int selected_ = 0;
    std::vector<EditableLine> editable_lines_;
    std::string command_buffer_;
    std::string edit_buffer_;
    Component editor_input_;
    Component radio_editor_;
    std::vector<std::string> dummy_radio_options_;
    int dummy_radio_selected_idx_ = 0;
    std::string active_config_path_buffer_;
    std::string history_size_buffer_;
    int selected_write_mode_idx_ = 0;
    int selected_config_save_idx_ = 0;
    int selected_editor_save_idx_ = 0;
    std::vector<std::string> write_mode_entries_ = {"minimal", "full"};
    std::vector<std::string> config_save_entries_ = {"current", "default", "ask", "none"};
    std::vector<std::string> editor_save_entries_ = {"ask", "auto_save_on_apply", "manual"};
};

bool save_settings_to(CliConfig& config, const std::string& path) {
    if (!write_config_to_file(config, path)) {
        std::cerr << "Error: Failed to save settings to " << path << std::endl;
        return false;
    }
    config.loaded_config_path = fs::absolute(path).string();
    std::cout << "Settings saved to " << config.loaded_config_path << std::endl;
    return true;
}

} // namespace

void run_config_editor(CliConfig& config) {
    auto screen = ScreenInteractive::Fullscreen();
    ConfigEditor editor(screen, config);
    editor.Run();
    if (!editor.changes_applied) return;
    if (config.config_save_behavior == "ask") {
        if (ask_yesno("Save settings changes to a file?", true)) {
            std::string default_path = config.loaded_config_path.empty() ? "config.yaml" : config.loaded_config_path;
            std::string path = ask("Enter path to save settings file", default_path);
            if (!path.empty()) save_settings_to(config, path);
        }
    } else if (config.config_save_behavior == "current") {
        save_settings_to(config, config.loaded_config_path.empty() ? "config.yaml" : config.loaded_config_path);
    } else if (config.config_save_behavior == "default") {
        save_settings_to(config, "config.yaml");
    }
}

} // namespace mo
