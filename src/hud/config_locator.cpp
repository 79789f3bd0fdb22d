#include "hud/config_locator.hpp"

#include <cctype>
#include <cstdlib>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace mo {

static fs::path home_dir() {
    const char* home = std::getenv("HOME");
#ifndef _WIN32
    if (home == nullptr || *home == '\0') {
        struct passwd* pw = getpwuid(getuid());
        if (pw) home = pw->pw_dir;
    }
#endif
    if (home == nullptr) return {};
    return home;
}

static bool has_exe_suffix(const std::string& name) {
    if (name.size() <= 4) return false;
    std::string ext = name.substr(name.size() - 4);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext == ".exe";
}

std::string app_basename(const std::string& app) {
    std::string name = fs::path(app).filename().string();
    if (has_exe_suffix(name)) name.erase(name.size() - 4);
    return name;
}

ConfigQuery query_for_app(const std::string& app) {
    ConfigQuery query;
    query.app = app;
    query.is_wine = has_exe_suffix(fs::path(app).filename().string());
    return query;
}

fs::path config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "MangoHud";
    fs::path home = home_dir();
    if (home.empty()) return fs::path(".config") / "MangoHud";
    return home / ".config" / "MangoHud";
}

std::vector<fs::path> candidate_paths(const ConfigQuery& query) {
    std::vector<fs::path> out;
    const char* env_file = std::getenv("MANGOHUD_CONFIGFILE");
    if (env_file && *env_file) out.emplace_back(env_file);

    if (!query.exe_dir.empty()) out.push_back(query.exe_dir / "MangoHud.conf");

    const fs::path dir = config_dir();
    const std::string app = app_basename(query.app);
    if (!app.empty()) {
        if (query.is_wine) out.push_back(dir / ("wine-" + app + ".conf"));
        out.push_back(dir / (app + ".conf"));
    }
    out.push_back(dir / "MangoHud.conf");
    return out;
}

std::optional<fs::path> resolve(const ConfigQuery& query) {
    std::error_code ec;
    for (const auto& p : candidate_paths(query)) {
        if (fs::is_regular_file(p, ec)) return p;
    }
    return std::nullopt;
}

fs::path default_path(const std::string& app) {
    const std::string name = app_basename(app);
    if (name.empty()) return config_dir() / "MangoHud.conf";
    return config_dir() / (name + ".conf");
}

} // namespace mo
