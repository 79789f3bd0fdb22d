// FILE: src/cli/command/help_utils.cpp
#include "cli/command/help_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#ifndef MANGOVERLAY_HELP_DIR
#define MANGOVERLAY_HELP_DIR "src/cli/command/help"
#endif

namespace fs = std::filesystem;

namespace mo {

void print_help_from_file(const std::string& filename) {
  const char* env_dir = std::getenv("MANGOVERLAY_HELP_DIR");
  fs::path path = fs::path(env_dir && *env_dir ? env_dir : MANGOVERLAY_HELP_DIR) / filename;
  std::ifstream in(path);
  if (!in) {
    std::cout << "(Help not available: " << path.string() << ")\n";
    return;
  }
  std::string line;
  while (std::getline(in, line)) {
    std::cout << line << '\n';
  }
}

}  // namespace mo
