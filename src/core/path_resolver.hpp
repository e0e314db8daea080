#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace penkit {

// True for names usable as one path component: letters, digits, '_', '-' and '.', but not "." or "..".
[[nodiscard]] bool is_safe_path_component(std::string_view name) noexcept;

class PathResolver {
  public:
    // Empty when the command is not an executable file in any PATH entry.
    [[nodiscard]] std::string find_command_path(std::string_view command) const;

    [[nodiscard]] static bool is_executable(const std::string &path);

  private:
    void scan_path_executables(
        std::string_view name,
        const std::function<bool(std::string_view full_path)> &callback) const;
};

} // namespace penkit
