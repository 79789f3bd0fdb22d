#include "cli_history.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

#include <pwd.h>
#include <unistd.h>

namespace mo {

CliHistory::CliHistory() : CliHistory(DefaultHistoryFilePath()) {}

CliHistory::CliHistory(std::filesystem::path file) : history_file_path_(std::move(file)) {
    Load();
}

std::filesystem::path CliHistory::DefaultHistoryFilePath() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    if (home == nullptr) {
        return ".mangoverlay_history"; // fallback to current dir
    }
    return std::filesystem::path(home) / ".mangoverlay_history";
}

void CliHistory::Load() {
    history_.clear();
    std::ifstream file(history_file_path_);
    if (file) {
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty()) history_.push_back(line);
        }
    }
    Trim();
    nav_index_ = static_cast<int>(history_.size());
}

void CliHistory::Save() const {
    std::ofstream file(history_file_path_);
    if (!file) {
        std::cerr << "Warning: Could not save command history to " << history_file_path_ << std::endl;
        return;
    }
    for (const auto& line : history_) {
        file << line << "\n";
    }
}

void CliHistory::Add(const std::string& command) {
    if (command.empty()) return;

    // Consecutive duplicates collapse into one entry
    if (history_.empty() || history_.back() != command) {
        history_.push_back(command);
        Trim();
    }
    nav_index_ = static_cast<int>(history_.size());
}

void CliHistory::Trim() {
    if (max_size_ == 0) return; // 0 means unlimited
    if (history_.size() > max_size_) {
        history_.erase(history_.begin(), history_.begin() + (history_.size() - max_size_));
    }
}

std::string CliHistory::GetPrevious(const std::string& current_prefix) {
    for (int i = nav_index_ - 1; i >= 0; --i) {
        if (history_[i].rfind(current_prefix, 0) == 0) {
            nav_index_ = i;
            return history_[i];
        }
    }
    return current_prefix;
}

std::string CliHistory::GetNext(const std::string& current_prefix) {
    for (size_t i = static_cast<size_t>(nav_index_ + 1); i < history_.size(); ++i) {
        if (history_[i].rfind(current_prefix, 0) == 0) {
            nav_index_ = static_cast<int>(i);
            return history_[i];
        }
    }
    // Past the newest entry: back to what the user typed
    nav_index_ = static_cast<int>(history_.size());
    return current_prefix;
}

void CliHistory::ResetNavigation() {
    nav_index_ = static_cast<int>(history_.size());
}

void CliHistory::SetMaxSize(size_t size) {
    max_size_ = size;
    Trim();
    nav_index_ = static_cast<int>(history_.size());
}

} // namespace mo
