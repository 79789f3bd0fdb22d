#include <iostream>
#include "cli/ask.hpp"
#include "cli/ask_yesno.hpp"

namespace mo {

bool ask_yesno(const std::string& q, bool def) {
    const std::string hint = def ? " [Y/n]" : " [y/N]";
    while (true) {
        std::string s = ask(q + hint, "");
        if (s.empty()) return def;
        if (s == "Y" || s == "y" || s == "yes") return true;
        if (s == "N" || s == "n" || s == "no") return false;
        std::cout << "Please answer y or n.\n";
    }
}

} // namespace mo
