#include "core/path_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

namespace penkit {

namespace fs = std::filesystem;

bool is_safe_path_component(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }

    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-' || c == '.';
    });
}

bool PathResolver::is_executable(const std::string &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }

    const auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return false;
    }

    constexpr auto executable_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (perms & executable_bits) != fs::perms::none;
}

void PathResolver::scan_path_executables(
    std::string_view name, const std::function<bool(std::string_view full_path)> &callback) const {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr || name.empty()) {
        return;
    }

    std::stringstream path_stream(path_env);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }

        const std::string candidate = (fs::path(dir) / name).string();
        if (!is_executable(candidate)) {
            continue;
        }

        if (callback(candidate)) {
            return;
        }
    }
}

std::string PathResolver::find_command_path(std::string_view command) const {
    std::string resolved_path;

    if (command.find('/') != std::string_view::npos) {
        const std::string direct(command);
        return is_executable(direct) ? direct : resolved_path;
    }

    scan_path_executables(command, [&](std::string_view full_path) {
        resolved_path = full_path;
        return true;
    });

    return resolved_path;
}

} // namespace penkit
