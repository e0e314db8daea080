#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "plugins/plugin.hpp"

namespace penkit {

enum class SessionState {
    Idle,
    ModuleSelected,
    Running,
};

[[nodiscard]] std::string_view state_name(SessionState state) noexcept;

struct ExecutionResult {
    std::uint64_t sequence{0};
    std::string module;
    std::chrono::system_clock::time_point started_at;
    std::string command;
    std::string standard_output;
    std::string standard_error;
    // -1 when no process ran.
    int exit_code{-1};
    std::chrono::milliseconds elapsed{0};
    YAML::Node payload;
    bool success{false};
    std::string error;
};

// A host or application under test.
struct Target {
    std::uint64_t id{0};
    std::string name;
    // IP address or URL.
    std::string address;
    std::string hostname;
    std::string description;
    std::string status;
    std::chrono::system_clock::time_point created_at;
};

struct Finding {
    std::uint64_t id{0};
    std::uint64_t target_id{0};
    std::string name;
    std::string description;
    // info, low, medium, high or critical.
    std::string severity{"info"};
    std::string status{"open"};
    // "<module> #<sequence>" for findings taken from a result, empty when added by hand.
    std::string source;
    std::chrono::system_clock::time_point created_at;
};

[[nodiscard]] bool is_known_severity(std::string_view severity) noexcept;

class Session {
  public:
    explicit Session(std::string id);

    [[nodiscard]] const std::string &id() const noexcept;
    [[nodiscard]] std::chrono::system_clock::time_point created_at() const noexcept;
    [[nodiscard]] std::chrono::system_clock::time_point updated_at() const noexcept;
    [[nodiscard]] SessionState state() const noexcept;

    void push(ModuleInstance instance);
    // Returns false when there was nothing to pop.
    bool pop();
    [[nodiscard]] ModuleInstance *active() noexcept;
    [[nodiscard]] const ModuleInstance *active() const noexcept;
    [[nodiscard]] std::size_t depth() const noexcept;
    // Outermost first.
    [[nodiscard]] std::vector<std::string> stack_names() const;

    void set_variable(const std::string &name, std::string value);
    bool unset_variable(std::string_view name);
    [[nodiscard]] const std::map<std::string, std::string, std::less<>> &variables() const noexcept;

    // Assigns the next sequence number.
    const ExecutionResult &append(ExecutionResult result);
    [[nodiscard]] const std::vector<ExecutionResult> &history() const noexcept;

    // Assigns the id. Throws DuplicateNameError when the name is taken.
    const Target &add_target(Target target);
    [[nodiscard]] const std::vector<Target> &targets() const noexcept;
    [[nodiscard]] const Target *find_target(std::uint64_t id) const noexcept;
    // Matches the address, then the hostname.
    [[nodiscard]] const Target *find_target(std::string_view address) const noexcept;

    // Assigns the id. Throws NotFoundError for an unknown target and InvalidOptionError for an
    // unknown severity.
    const Finding &add_finding(Finding finding);
    // All findings, or only those of one target.
    [[nodiscard]] std::vector<const Finding *> findings(std::optional<std::uint64_t> target_id = std::nullopt) const;
    [[nodiscard]] bool has_finding(std::uint64_t target_id, std::string_view name, std::string_view description) const;

    void set_running(bool running) noexcept;

  private:
    std::string id_;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point updated_at_;
    std::vector<ModuleInstance> stack_;
    std::map<std::string, std::string, std::less<>> variables_;
    std::vector<ExecutionResult> history_;
    std::uint64_t next_sequence_{1};
    std::vector<Target> targets_;
    std::vector<Finding> findings_;
    bool running_{false};
};

} // namespace penkit
