#pragma once

#include <termios.h>

namespace mo {

// Special key codes returned by GetChar
enum Key {
    // Printable keys are returned as their char value
    UP = 1000,
    DOWN,
    LEFT,
    RIGHT,
    HOME,
    END,
    BACKSPACE,
    ENTER,
    TAB,
    DEL,
    ESC,
    CTRL_C,
    CTRL_D,
    UNKNOWN
};

// Raw-mode stdin reader for the REPL line editor.
class TerminalInput {
public:
    TerminalInput();
    ~TerminalInput();
    TerminalInput(const TerminalInput&) = delete;
    TerminalInput& operator=(const TerminalInput&) = delete;

    int GetChar();

    void Restore();
    void SetRaw();
    bool IsTerminal() const { return is_tty_; }

private:
    struct termios original_termios_{};
    bool is_tty_ = false;
};

} // namespace mo
