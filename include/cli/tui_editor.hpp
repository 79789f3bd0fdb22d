#pragma once
#include "ftxui/component/screen_interactive.hpp"

namespace mo {

// Base class for the full-screen editors; they share the screen instance.
class TuiEditor {
public:
    explicit TuiEditor(ftxui::ScreenInteractive& screen) : screen_(screen) {}
    virtual ~TuiEditor() = default;
    virtual void Run() = 0; // Each editor implements its own loop.

protected:
    ftxui::ScreenInteractive& screen_;
};

} // namespace mo
