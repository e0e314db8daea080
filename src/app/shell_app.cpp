#include "app/shell_app.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include <readline/readline.h>

#include "core/errors.hpp"
#include "modules/builtin_modules.hpp"

namespace penkit {

ShellApp::ShellApp(AppOptions options)
    : options_(std::move(options)),
      logger_(std::cerr),
      config_(options_.config_path.empty() ? ConfigStore::default_user_file() : options_.config_path),
      path_resolver_(),
      tools_(config_, path_resolver_, logger_),
      registry_(logger_),
      sessions_(registry_, config_, tools_, logger_),
      interpreter_(sessions_, config_, registry_, tools_),
      script_runner_(interpreter_),
      history_manager_() {}

int ShellApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    try {
        config_.load();
    } catch (const ConfigError &error) {
        std::cerr << "penkit: " << error.what() << std::endl;
        return 1;
    }

    configure_logging();
    load_plugins();

    if (!options_.scripts.empty()) {
        return run_scripts();
    }

    return run_interactive();
}

void ShellApp::configure_logging() {
    const auto level_name = config_.get_string("log.level");
    if (const auto level = log_level_from_name(level_name); level.has_value()) {
        logger_.set_level(*level);
    } else {
        logger_.warning("unknown log level '" + level_name + "', using info");
    }

    if (config_.get_bool("debug")) {
        logger_.set_level(LogLevel::Debug);
    }

    if (const auto file = config_.get_string("log.file"); !file.empty()) {
        const auto path = expand_home(file);
        if (!logger_.open_file(path)) {
            logger_.warning("cannot open log file " + path);
        }
    }
}

void ShellApp::load_plugins() {
    tools_.add_builtin_tools();
    register_builtin_modules(registry_);

    const auto directory = expand_home(config_.get_string("plugins.path"));
    const auto loaded = registry_.discover(directory, tools_);
    logger_.debug(std::to_string(registry_.size()) + " module(s) available, " + std::to_string(loaded) +
                  " from " + directory);
}

int ShellApp::run_scripts() {
    const bool continue_on_error = options_.continue_on_error || config_.get_bool("shell.script_continue_on_error");

    for (const auto &script : options_.scripts) {
        ScriptReport report;
        try {
            report = script_runner_.run_file(script, continue_on_error, std::cout, std::cerr);
        } catch (const ScriptError &error) {
            std::cerr << "penkit: " << error.what() << std::endl;
            return 1;
        }

        if (!report.ok()) {
            return 2;
        }

        if (report.exit_requested) {
            break;
        }
    }

    return 0;
}

int ShellApp::run_interactive() {
    history_manager_.initialize(expand_home(config_.get_string("shell.history_file")));

    while (true) {
        const auto prompt = interpreter_.prompt();
        char *line = readline(prompt.c_str());
        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        history_manager_.record_input(input);

        if (interpreter_.execute(input, std::cout, std::cerr) == CommandStatus::Exit) {
            break;
        }
    }

    if (!history_manager_.save()) {
        logger_.warning("cannot write history file " + history_manager_.path());
    }

    return 0;
}

} // namespace penkit
