#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "plugins/option_set.hpp"
#include "session/session.hpp"

namespace penkit {

class ConfigStore;
class Logger;
class PluginRegistry;
class ToolCatalog;

class SessionManager {
  public:
    // Starts with a current session named "default".
    SessionManager(const PluginRegistry &registry, const ConfigStore &config, const ToolCatalog &tools,
                   Logger &logger);

    static constexpr std::string_view default_session_id = "default";

    // Throws DuplicateSessionError.
    Session &create(std::string_view id);
    // Throws NotFoundError.
    void switch_to(std::string_view id);
    // Throws NotFoundError, or SessionError for the current session.
    void remove(std::string_view id);
    [[nodiscard]] std::vector<const Session *> list() const;
    [[nodiscard]] Session &current();
    [[nodiscard]] const Session &current() const;
    [[nodiscard]] const std::string &current_id() const noexcept;

    // Throws NotFoundError for unknown modules.
    ModuleInstance &use(std::string_view module_name);
    // Returns false on an empty stack.
    bool back();

    void set_option(std::string_view name, std::string_view value);
    void unset_option(std::string_view name);
    [[nodiscard]] std::vector<ResolvedOption> options() const;

    void set_variable(std::string_view name, std::string_view value);
    // Returns false when the variable was not set.
    bool unset_variable(std::string_view name);
    [[nodiscard]] const std::map<std::string, std::string, std::less<>> &variables() const;

    // Throws NoModuleSelectedError or MissingRequiredOptionError before the module runs.
    // Anything the module itself throws is recorded as a failed result. Hosts, open ports and
    // vulnerabilities in a successful payload become targets and findings of the session.
    const ExecutionResult &run();

    // Throws InvalidOptionError for an empty name and DuplicateNameError for a taken one.
    const Target &add_target(std::string name, std::string address, std::string hostname);
    [[nodiscard]] const std::vector<Target> &targets() const;
    // Throws NotFoundError for an unknown target and InvalidOptionError for an unknown severity.
    const Finding &add_finding(std::uint64_t target_id, std::string severity, std::string name);
    [[nodiscard]] std::vector<const Finding *> findings(std::optional<std::uint64_t> target_id = std::nullopt) const;

  private:
    const PluginRegistry &registry_;
    const ConfigStore &config_;
    const ToolCatalog &tools_;
    Logger &logger_;
    std::vector<std::unique_ptr<Session>> sessions_;
    std::string current_id_;

    [[nodiscard]] Session *find(std::string_view id) const;
    [[nodiscard]] ModuleInstance &active_module();
    [[nodiscard]] const ModuleInstance &active_module() const;
    void record_findings(Session &session, const ExecutionResult &result);
    [[nodiscard]] std::uint64_t target_for(Session &session, const std::string &address, const std::string &hostname,
                                           const std::string &status);
    void archive(const Session &session, const ExecutionResult &result) const;
    // Writes <sessions.path>/<id>/session.yaml when results are archived.
    void save_summary(const Session &session) const;
};

} // namespace penkit
