#include "cli/ask.hpp"

#include <iostream>
#include <string>

namespace mo {

std::string ask(const std::string& q, const std::string& def) {
  std::cout << q;
  if (!def.empty())
    std::cout << " [" << def << "]";
  std::cout << ": " << std::flush;
  std::string s;
  if (!std::getline(std::cin, s))
    return def;
  // Strip a trailing CR left by terminals still in raw mode
  if (!s.empty() && s.back() == '\r')
    s.pop_back();
  if (s.empty())
    return def;
  return s;
}

}  // namespace mo
