#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/parser.hpp"

namespace penkit {

class ConfigStore;
class PluginRegistry;
class SessionManager;
class ToolCatalog;
struct ExecutionResult;

enum class CommandStatus {
    Ok,
    Error,
    Exit,
};

class ShellInterpreter {
  public:
    using CommandFunc = std::function<CommandStatus(const std::vector<std::string> &, std::ostream &, std::ostream &)>;

    ShellInterpreter(SessionManager &sessions, ConfigStore &config, const PluginRegistry &registry,
                     const ToolCatalog &tools);

    // Runs one input line. Errors are written to err as a single "error: ..." line.
    CommandStatus execute(std::string_view line, std::ostream &out, std::ostream &err);

    [[nodiscard]] bool is_command(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    // Every non-blank line given to execute, in order.
    [[nodiscard]] const std::vector<std::string> &history() const noexcept;
    [[nodiscard]] std::string prompt() const;

  private:
    SessionManager &sessions_;
    ConfigStore &config_;
    const PluginRegistry &registry_;
    const ToolCatalog &tools_;
    Parser parser_;
    std::vector<std::string> history_;
    std::unordered_map<std::string, CommandFunc> commands_;

    void register_commands();

    CommandStatus command_use(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_set(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_unset(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_show(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_run(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_back(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_sessions(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_targets(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_findings(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_info(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_config(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_help(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    CommandStatus command_exit(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

    void show_modules(std::ostream &out) const;
    void show_options(std::ostream &out) const;
    void show_history(std::ostream &out) const;
    void show_tools(std::ostream &out) const;
    void show_variables(std::ostream &out) const;
    void show_commands(std::ostream &out) const;
    void show_targets(std::ostream &out) const;
    void show_findings(std::ostream &out, std::optional<std::uint64_t> target_id = std::nullopt) const;

    static void render_result(const ExecutionResult &result, std::ostream &out);
};

} // namespace penkit
