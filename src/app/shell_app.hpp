#pragma once

#include <string>
#include <vector>

#include "config/config_store.hpp"
#include "core/path_resolver.hpp"
#include "history/history_manager.hpp"
#include "log/logger.hpp"
#include "plugins/plugin_registry.hpp"
#include "session/session_manager.hpp"
#include "shell/script_runner.hpp"
#include "shell/shell_interpreter.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

struct AppOptions {
    std::string config_path;
    std::vector<std::string> scripts;
    bool continue_on_error{false};
};

class ShellApp {
  public:
    explicit ShellApp(AppOptions options);

    // 0 on a normal exit, 1 on a startup failure, 2 when a script command failed.
    int run();

  private:
    AppOptions options_;
    Logger logger_;
    ConfigStore config_;
    PathResolver path_resolver_;
    ToolCatalog tools_;
    PluginRegistry registry_;
    SessionManager sessions_;
    ShellInterpreter interpreter_;
    ScriptRunner script_runner_;
    HistoryManager history_manager_;

    void configure_logging();
    void load_plugins();
    int run_scripts();
    int run_interactive();
};

} // namespace penkit
