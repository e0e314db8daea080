#include "log/logger.hpp"

#include <chrono>
#include <ctime>
#include <ios>
#include <ostream>

namespace penkit {

namespace {

[[nodiscard]] std::string_view level_label(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }

    return "info";
}

[[nodiscard]] std::string timestamp_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
    localtime_r(&now, &parts);

    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &parts);
    return std::string(buffer, written);
}

} // namespace

std::optional<LogLevel> log_level_from_name(std::string_view name) noexcept {
    if (name == "debug") {
        return LogLevel::Debug;
    }

    if (name == "info") {
        return LogLevel::Info;
    }

    if (name == "warning" || name == "warn") {
        return LogLevel::Warning;
    }

    if (name == "error") {
        return LogLevel::Error;
    }

    return std::nullopt;
}

Logger::Logger(std::ostream &sink, LogLevel level) : sink_(sink), level_(level) {}

void Logger::set_level(LogLevel level) noexcept { level_ = level; }

LogLevel Logger::level() const noexcept { return level_; }

bool Logger::open_file(const std::string &path) {
    if (file_.is_open()) {
        file_.close();
    }

    file_.open(path, std::ios::app);
    return file_.is_open();
}

void Logger::debug(std::string_view message) { write(LogLevel::Debug, message); }

void Logger::info(std::string_view message) { write(LogLevel::Info, message); }

void Logger::warning(std::string_view message) { write(LogLevel::Warning, message); }

void Logger::error(std::string_view message) { write(LogLevel::Error, message); }

void Logger::write(LogLevel level, std::string_view message) {
    if (level < level_) {
        return;
    }

    sink_ << '[' << level_label(level) << "] " << message << std::endl;

    if (file_.is_open()) {
        file_ << timestamp_now() << " [" << level_label(level) << "] " << message << '\n';
        file_.flush();
    }
}

} // namespace penkit
