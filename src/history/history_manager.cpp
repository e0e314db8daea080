#include "history/history_manager.hpp"

#include <cstring>
#include <filesystem>
#include <system_error>

#include <readline/history.h>

namespace penkit {

namespace fs = std::filesystem;

namespace {

constexpr int max_history_entries = 1000;

} // namespace

void HistoryManager::initialize(const std::string &path) {
    using_history();
    stifle_history(max_history_entries);

    history_file_path_ = path;
    if (!history_file_path_.empty()) {
        read_history(history_file_path_.c_str());
    }
}

bool HistoryManager::save() const {
    if (history_file_path_.empty()) {
        return true;
    }

    const fs::path target(history_file_path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    return write_history(history_file_path_.c_str()) == 0;
}

void HistoryManager::record_input(const std::string &input) const {
    if (input.empty()) {
        return;
    }

    if (history_length == 0) {
        add_history(input.c_str());
        return;
    }

    const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
    if (last_entry == nullptr || std::strcmp(input.c_str(), last_entry->line) != 0) {
        add_history(input.c_str());
    }
}

const std::string &HistoryManager::path() const noexcept { return history_file_path_; }

} // namespace penkit
