// TUI overlay editor: every registered parameter grouped by section
#include "cli/hud_editor.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cli/ask_yesno.hpp"
#include "cli/hud_edit_session.hpp"
#include "cli/path_complete.hpp"
#include "cli/tui_editor.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/dom/elements.hpp"
#include "hud/param_registry.hpp"

using namespace ftxui;

namespace mo {

namespace {

const char* kUnsetLabel = "(unset)";

class HudEditor : public TuiEditor {
    struct Row {
        std::string section;              // set for header rows
        const ParamSpec* spec = nullptr;  // set for parameter rows
        bool is_header() const { return spec == nullptr; }
    };
public:
    HudEditor(ScreenInteractive& screen, HudEditSession& session, const CliConfig& settings)
        : TuiEditor(screen), session_(session), settings_(settings) {
        InputOption opt; opt.on_enter = [this]{ CommitEdit(); };
        editor_input_ = Input(&edit_buffer_, "...", opt);
        radio_editor_ = Radiobox(&radio_options_, &radio_selected_);
        only_changed_ = !settings_.show_defaults;
        RebuildRows();
    }

    void Run() override {
        auto component = Renderer(Container::Vertical({}), [&] {
            Elements lines;
            for (size_t i = 0; i < rows_.size(); ++i) {
                const Row& row = rows_[i];
                if (row.is_header()) {
                    lines.push_back(text("### " + row.section) | bold | color(Color::Cyan));
                    continue;
                }
                Element value;
                if (mode_ == Mode::Edit && selected_ == (int)i) {
                    value = row.spec->kind == ParamKind::Enum ? radio_editor_->Render() : editor_input_->Render();
                } else {
                    value = RenderValue(*row.spec);
                }
                const bool changed = !is_default(session_.config(), row.spec->key);
                auto line = hbox({ text(changed ? "* " : "  "),
                                   text(row.spec->key) | size(WIDTH, EQUAL, 32),
                                   value | flex });
                if (selected_ == (int)i) line = line | inverted | focus;
                lines.push_back(line);
            }
            if (lines.empty()) lines.push_back(text("No parameters differ from the defaults. Press 'c' to show all.") | dim);
            std::string title = "MangoHud config: " + session_.doc();
            if (session_.dirty()) title += " [modified]";
            return vbox({ text(title) | bold | hcenter, separator(),
                          vbox(std::move(lines)) | vscroll_indicator | frame | flex,
                          separator(), RenderDescription(), RenderStatusBar() });
        });
        component |= CatchEvent([&](Event event) { return HandleEvent(event); });
        screen_.Loop(component);
    }

private:
    enum class Mode { Navigate, Edit, Command };

    bool HandleEvent(Event& event) {
        if (mode_ == Mode::Command) {
            if (event == Event::Return) { ExecuteCommand(); return true; }
            if (event == Event::Escape) { mode_ = Mode::Navigate; command_buffer_.clear(); return true; }
            if (event == Event::Backspace) { if (!command_buffer_.empty()) command_buffer_.pop_back(); return true; }
            if (event.is_character()) { command_buffer_ += event.character(); return true; }
            return false;
        }
        if (mode_ == Mode::Edit) {
            if (event == Event::Escape) { mode_ = Mode::Navigate; session_.set_status("Edit cancelled"); return true; }
            if (event == Event::Return) { CommitEdit(); return true; }
            const ParamSpec* spec = SelectedSpec();
            if (spec && spec->kind == ParamKind::Enum) return radio_editor_->OnEvent(event);
            if (event == Event::Tab && spec && spec->kind == ParamKind::Path) {
                auto common = LongestCommonPrefix(PathCompleteOptions(edit_buffer_));
                if (!common.empty()) edit_buffer_ = common;
                return true;
            }
            return editor_input_->OnEvent(event);
        }
        if (event == Event::ArrowDown) { MoveSelection(+1); return true; }
        if (event == Event::ArrowUp) { MoveSelection(-1); return true; }
        if (event == Event::PageDown) { MoveSelection(+15); return true; }
        if (event == Event::PageUp) { MoveSelection(-15); return true; }
        if (event == Event::Character('e') || event == Event::Return) { EnterEditMode(); return true; }
        if (event == Event::Character('r')) { ResetSelected(); return true; }
        if (event == Event::Character('c')) { only_changed_ = !only_changed_; RebuildRows(); return true; }
        if (event == Event::Character(':')) { mode_ = Mode::Command; return true; }
        if (event == Event::Character('q')) { if (session_.execute("q")) screen_.Exit(); return true; }
        return false;
    }

    Element RenderValue(const ParamSpec& spec) const {
        auto value = spec.format(session_.config());
        if (!value) return text(kUnsetLabel) | dim;
        if (spec.kind == ParamKind::Bool) return text(*value == "1" ? "[x]" : "[ ]");
        if (value->empty()) return text("\"\"") | dim;
        return text(*value);
    }

    Element RenderDescription() const {
        const ParamSpec* spec = SelectedSpec();
        if (!spec) return text("");
        std::string info = std::string(to_string(spec->kind)) + " | " + spec->description;
        if (spec->orderable && !session_.config().legacy_layout) info += " | drawn in layout order";
        return text(info) | dim;
    }

    Element RenderStatusBar() const {
        if (mode_ == Mode::Command) {
            return hbox({ text(":" + command_buffer_), text(" ") | blink, filler(),
                          text("[a]pply | [w]rite | [q]uit | q! discard | Esc:Cancel") | dim }) | inverted;
        }
        std::string help = mode_ == Mode::Edit
            ? "Enter:Accept | Esc:Cancel"
            : "↑/↓:Move | e:Edit/Toggle | r:Reset | c:Changed/All | q:Quit | ::Command";
        return hbox({ text(help) | dim, filler(), text(session_.status()) | bold });
    }

    const ParamSpec* SelectedSpec() const {
        if (selected_ < 0 || selected_ >= (int)rows_.size()) return nullptr;
        return rows_[selected_].spec;
    }

    void RebuildRows() {
        const std::string keep = SelectedSpec() ? SelectedSpec()->key : std::string();
        rows_.clear();
        for (const auto& section : sections()) {
            std::vector<const ParamSpec*> params = params_in_section(section);
            if (only_changed_) {
                params.erase(std::remove_if(params.begin(), params.end(),
                                            [&](const ParamSpec* p) { return is_default(session_.config(), p->key); }),
                             params.end());
            }
            if (params.empty()) continue;
            rows_.push_back({section, nullptr});
            for (const ParamSpec* p : params) rows_.push_back({"", p});
        }
        selected_ = -1;
        for (size_t i = 0; i < rows_.size(); ++i) {
            if (!rows_[i].is_header() && (selected_ < 0 || rows_[i].spec->key == keep)) {
                selected_ = (int)i;
                if (rows_[i].spec->key == keep) break;
            }
        }
    }

    void MoveSelection(int delta) {
        if (rows_.empty()) return;
        int target = std::clamp(selected_ + delta, 0, (int)rows_.size() - 1);
        const int step = delta > 0 ? 1 : -1;
        // Skip section headers
        while (target >= 0 && target < (int)rows_.size() && rows_[target].is_header()) target += step;
        if (target < 0 || target >= (int)rows_.size()) return;
        selected_ = target;
    }

    void EnterEditMode() {
        const ParamSpec* spec = SelectedSpec();
        if (!spec) return;
        if (spec->kind == ParamKind::Bool) {
            Assign(*spec, spec->format(session_.config()).value_or("0") == "1" ? "0" : "1");
            return;
        }
        if (spec->kind == ParamKind::Enum && spec->choices) {
            radio_options_ = *spec->choices;
            // Optional enums (vsync) may also be left unset
            if (!spec->format(default_config(session_.config().legacy_layout))) radio_options_.push_back(kUnsetLabel);
            const std::string current = spec->format(session_.config()).value_or(kUnsetLabel);
            auto it = std::find(radio_options_.begin(), radio_options_.end(), current);
            radio_selected_ = it == radio_options_.end() ? 0 : (int)std::distance(radio_options_.begin(), it);
            RadioboxOption opt;
            opt.entries = &radio_options_;
            opt.selected = &radio_selected_;
            opt.focused_entry = &radio_selected_;
            radio_editor_ = Radiobox(opt);
            radio_editor_->TakeFocus();
        } else {
            edit_buffer_ = spec->format(session_.config()).value_or("");
            editor_input_->TakeFocus();
        }
        mode_ = Mode::Edit;
    }

    void CommitEdit() {
        const ParamSpec* spec = SelectedSpec();
        mode_ = Mode::Navigate;
        if (!spec) return;
        if (spec->kind == ParamKind::Enum) {
            if (radio_selected_ < 0 || radio_selected_ >= (int)radio_options_.size()) return;
            const std::string& choice = radio_options_[radio_selected_];
            Assign(*spec, choice == kUnsetLabel ? std::string() : choice);
        } else {
            Assign(*spec, edit_buffer_);
        }
    }

    void Assign(const ParamSpec& spec, const std::string& value) {
        session_.assign(spec.key, value);
        if (only_changed_) RebuildRows();
    }

    void ResetSelected() {
        const ParamSpec* spec = SelectedSpec();
        if (!spec) return;
        session_.reset(spec->key);
        if (only_changed_) RebuildRows();
    }

    void ExecuteCommand() {
        const std::string cmd = command_buffer_;
        command_buffer_.clear();
        mode_ = Mode::Navigate;
        if (session_.execute(cmd)) screen_.Exit();
    }

    HudEditSession& session_;
    const CliConfig& settings_;

    std::vector<Row> rows_;
    int selected_ = 0;
    bool only_changed_ = false;
    Mode mode_ = Mode::Navigate;
    std::string command_buffer_;
    std::string edit_buffer_;
    Component editor_input_;
    Component radio_editor_;
    std::vector<std::string> radio_options_;
    int radio_selected_ = 0;
};

} // namespace

bool run_hud_editor(InteractionService& svc, const std::string& doc, CliConfig& config) {
    auto snapshot = svc.cmd_snapshot(doc);
    if (!snapshot) {
        std::cerr << "Error: No document named '" << doc << "'." << std::endl;
        return false;
    }
    HudEditSession session(svc, doc, config, std::move(*snapshot));
    auto screen = ScreenInteractive::Fullscreen();
    HudEditor editor(screen, session, config);
    editor.Run();
    if (!session.applied() || session.saved()) return session.applied();

    if (config.editor_save_behavior == "ask") {
        auto path = svc.cmd_document_path(doc);
        if (path && !path->empty() && ask_yesno("Save '" + doc + "' to " + path->string() + "?", true)) {
            if (svc.cmd_save(doc, {}, to_write_options(config))) {
                std::cout << "Saved '" << doc << "' to " << path->string() << std::endl;
            } else {
                auto err = svc.cmd_last_error(doc);
                std::cerr << "Error: " << (err ? err->message : std::string("save failed")) << std::endl;
            }
        }
    }
    return true;
}

} // namespace mo
