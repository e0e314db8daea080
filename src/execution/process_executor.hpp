#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace penkit {

// Upper bound accepted for module, manifest and configured tool timeouts.
inline constexpr std::chrono::seconds max_tool_timeout{7 * 24 * 60 * 60};

struct ProcessOutput {
    std::string standard_output;
    std::string standard_error;
    int exit_code{0};
    std::chrono::milliseconds elapsed{0};
    bool timed_out{false};
};

class ProcessExecutor {
  public:
    // Runs argv in its own process group and captures both streams. Throws std::invalid_argument
    // for a non-positive timeout; very large ones saturate. On timeout the whole group is killed
    // and reaped before returning with timed_out set.
    [[nodiscard]] ProcessOutput execute(
        const std::vector<std::string> &argv, std::chrono::milliseconds timeout) const;

  private:
    [[noreturn]] static void execute_in_child(
        const std::vector<std::string> &argv, int stdout_fd, int stderr_fd) noexcept;

    static void kill_group(pid_t pid) noexcept;
    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace penkit
