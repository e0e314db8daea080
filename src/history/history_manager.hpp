#pragma once

#include <string>

namespace penkit {

// Interactive input history backed by readline, persisted between runs.
class HistoryManager {
  public:
    // Loads previous entries from path if it exists. An empty path disables persistence.
    void initialize(const std::string &path);
    // Returns false when the history file cannot be written.
    [[nodiscard]] bool save() const;
    void record_input(const std::string &input) const;

    [[nodiscard]] const std::string &path() const noexcept;

  private:
    std::string history_file_path_;
};

} // namespace penkit
