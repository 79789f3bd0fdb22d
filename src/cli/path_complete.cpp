#include "cli/path_complete.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace mo {

namespace fs = std::filesystem;

std::vector<std::string> PathCompleteOptions(const std::string& prefix) {
    std::vector<std::string> options;

    std::string completion_prefix;         // text kept in front of the filename
    std::string basename_prefix = prefix;  // part matched within the directory
    auto last_slash = prefix.find_last_of('/');
    if (last_slash != std::string::npos) {
        completion_prefix = prefix.substr(0, last_slash + 1);
        basename_prefix = prefix.substr(last_slash + 1);
    }

    std::string list_dir = completion_prefix.empty() ? "." : completion_prefix;
    if (list_dir.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) list_dir = std::string(home) + list_dir.substr(1);
    }

    std::error_code ec;
    fs::directory_iterator it(list_dir, ec);
    if (ec) return options;
    for (const auto& entry : it) {
        std::string filename = entry.path().filename().string();
        if (filename.rfind(basename_prefix, 0) != 0) continue;
        // Hidden entries only when asked for
        if (!filename.empty() && filename[0] == '.' && basename_prefix.empty()) continue;
        std::string completion = completion_prefix + filename;
        if (entry.is_directory(ec)) completion += "/";
        options.push_back(std::move(completion));
    }

    auto is_conf = [](const std::string& s) {
        return s.size() > 5 && s.compare(s.size() - 5, 5, ".conf") == 0;
    };
    std::sort(options.begin(), options.end(), [&](const std::string& a, const std::string& b) {
        if (is_conf(a) != is_conf(b)) return is_conf(a);
        return a < b;
    });
    return options;
}

std::string LongestCommonPrefix(const std::vector<std::string>& options) {
    if (options.empty()) return "";
    std::string prefix = options[0];
    for (size_t i = 1; i < options.size(); ++i) {
        size_t n = 0;
        while (n < prefix.size() && n < options[i].size() && prefix[n] == options[i][n]) ++n;
        prefix.resize(n);
    }
    return prefix;
}

} // namespace mo
