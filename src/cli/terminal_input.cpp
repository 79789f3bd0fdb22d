#include "cli/terminal_input.hpp"

#include <unistd.h>

namespace mo {

void TerminalInput::SetRaw() {
    if (!is_tty_) return;
    struct termios raw = original_termios_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= (CS8);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

void TerminalInput::Restore() {
    if (!is_tty_) return;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
}

TerminalInput::TerminalInput() {
    is_tty_ = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original_termios_) != -1;
    SetRaw();
}

TerminalInput::~TerminalInput() {
    Restore();
}

int TerminalInput::GetChar() {
    char c;
    if (read(STDIN_FILENO, &c, 1) != 1) return CTRL_D;

    if (c == 3) return CTRL_C;
    if (c == 4) return CTRL_D;
    if (c == '\x1b') {
        char seq[3];
        if (read(STDIN_FILENO, &seq[0], 1) != 1) return ESC;
        if (read(STDIN_FILENO, &seq[1], 1) != 1) return UNKNOWN;
        if (seq[0] == '[') {
            if (seq[1] >= '0' && seq[1] <= '9') {
                if (read(STDIN_FILENO, &seq[2], 1) != 1) return UNKNOWN;
                if (seq[2] == '~') {
                    switch (seq[1]) {
                        case '1': case '7': return HOME;
                        case '3': return DEL;
                        case '4': case '8': return END;
                        default: return UNKNOWN;
                    }
                }
            } else {
                switch (seq[1]) {
                    case 'A': return UP;
                    case 'B': return DOWN;
                    case 'C': return RIGHT;
                    case 'D': return LEFT;
                    case 'H': return HOME;
                    case 'F': return END;
                }
            }
        } else if (seq[0] == 'O') {
            if (seq[1] == 'H') return HOME;
            if (seq[1] == 'F') return END;
        }
        return UNKNOWN;
    }
    if (c == 127 || c == 8) return BACKSPACE;
    if (c == '\n' || c == '\r') return ENTER;
    if (c == '\t') return TAB;
    if (c == 1) return HOME;  // Ctrl+A
    if (c == 5) return END;   // Ctrl+E
    return static_cast<unsigned char>(c);
}

} // namespace mo
