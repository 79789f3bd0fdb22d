// Where MangoHud looks for its config file.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mo_types.hpp"

namespace mo {

struct ConfigQuery {
    std::string app;      // executable name, e.g. "game" or "game.exe"
    fs::path exe_dir;     // directory of the executable, if known
    bool is_wine = false; // true for wine/proton processes
};

// "game.exe" -> "game"
std::string app_basename(const std::string& app);

// Query for an application name; a ".exe" name is looked up as a wine app.
ConfigQuery query_for_app(const std::string& app);

// $XDG_CONFIG_HOME/MangoHud, falling back to $HOME/.config/MangoHud and
// then the passwd home directory.
fs::path config_dir();

// Candidate files in MangoHud's lookup order:
//   $MANGOHUD_CONFIGFILE, <exe_dir>/MangoHud.conf, wine-<app>.conf,
//   <app>.conf, MangoHud.conf
std::vector<fs::path> candidate_paths(const ConfigQuery& query);

// First candidate that exists.
std::optional<fs::path> resolve(const ConfigQuery& query);

// Path a new config for `app` should be written to; the global
// MangoHud.conf when `app` is empty.
fs::path default_path(const std::string& app = "");

} // namespace mo
