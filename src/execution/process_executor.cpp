#include "execution/process_executor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace penkit {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] std::vector<char *> build_argv(const std::vector<std::string> &argv) {
    std::vector<char *> result;
    result.reserve(argv.size() + 1);

    for (const auto &arg : argv) {
        result.push_back(const_cast<char *>(arg.c_str()));
    }
    result.push_back(nullptr);

    return result;
}

void close_fd(int &fd) noexcept {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) noexcept {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Reads whatever is available. Closes the descriptor on end of file.
void drain(int &fd, std::string &sink) {
    char buffer[4096];

    while (fd != -1) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<std::size_t>(n));
            continue;
        }

        if (n == 0) {
            close_fd(fd);
            return;
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }

        close_fd(fd);
        return;
    }
}

// Saturates at the clock's maximum instead of overflowing.
[[nodiscard]] Clock::time_point deadline_after(Clock::time_point start, std::chrono::milliseconds timeout) {
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start);
    if (timeout >= headroom) {
        return Clock::time_point::max();
    }

    return start + timeout;
}

[[nodiscard]] int remaining_ms(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return static_cast<int>(std::clamp<long long>(left, 0, std::numeric_limits<int>::max()));
}

} // namespace

ProcessOutput ProcessExecutor::execute(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) const {
    if (argv.empty()) {
        throw std::runtime_error("empty command");
    }

    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        throw std::runtime_error("pipe failed");
    }

    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw std::runtime_error("pipe failed");
    }

    const auto started = Clock::now();
    const auto deadline = deadline_after(started, timeout);

    const pid_t pid = fork();
    if (pid == -1) {
        for (const int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) {
            close(fd);
        }
        throw std::runtime_error("fork failed");
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        execute_in_child(argv, stdout_pipe[1], stderr_pipe[1]);
    }

    // Mirrors the child's setpgid so killpg works even if the child has not run yet.
    setpgid(pid, pid);

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    ProcessOutput output;

    while (out_fd != -1 || err_fd != -1) {
        if (Clock::now() >= deadline) {
            output.timed_out = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        for (const int fd : {out_fd, err_fd}) {
            if (fd != -1) {
                fds[count++] = pollfd{.fd = fd, .events = POLLIN, .revents = 0};
            }
        }

        const int ready = poll(fds.data(), count, remaining_ms(deadline));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }

            kill_group(pid);
            (void)wait_for_process(pid);
            close_fd(out_fd);
            close_fd(err_fd);
            throw std::runtime_error("poll failed");
        }

        drain(out_fd, output.standard_output);
        drain(err_fd, output.standard_error);
    }

    if (!output.timed_out) {
        int status = 0;
        while (true) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                output.exit_code = wait_status_to_exit_code(status);
                break;
            }

            if (waited == -1) {
                if (errno == EINTR) {
                    continue;
                }

                throw std::runtime_error("waitpid failed");
            }

            if (Clock::now() >= deadline) {
                output.timed_out = true;
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (output.timed_out) {
        kill_group(pid);
        output.exit_code = wait_for_process(pid);
        drain(out_fd, output.standard_output);
        drain(err_fd, output.standard_error);
    }

    close_fd(out_fd);
    close_fd(err_fd);

    output.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    return output;
}

void ProcessExecutor::execute_in_child(const std::vector<std::string> &argv, int stdout_fd, int stderr_fd) noexcept {
    setpgid(0, 0);

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd != -1) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }

    dup2(stdout_fd, STDOUT_FILENO);
    dup2(stderr_fd, STDERR_FILENO);
    // Only the three standard streams reach the tool.
    closefrom(STDERR_FILENO + 1);

    auto args = build_argv(argv);
    execvp(args.front(), args.data());
    std::perror("exec failed");
    _exit(127);
}

void ProcessExecutor::kill_group(pid_t pid) noexcept {
    if (killpg(pid, SIGKILL) == -1) {
        kill(pid, SIGKILL);
    }
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace penkit
