#pragma once

#include <fstream>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace penkit {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
};

[[nodiscard]] std::optional<LogLevel> log_level_from_name(std::string_view name) noexcept;

class Logger {
  public:
    explicit Logger(std::ostream &sink, LogLevel level = LogLevel::Info);

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

    // Lines are appended with a timestamp. Returns false when the file cannot be opened.
    bool open_file(const std::string &path);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warning(std::string_view message);
    void error(std::string_view message);

  private:
    std::ostream &sink_;
    LogLevel level_;
    std::ofstream file_;

    void write(LogLevel level, std::string_view message);
};

} // namespace penkit
