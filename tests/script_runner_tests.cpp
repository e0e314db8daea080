#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "core/path_resolver.hpp"
#include "log/logger.hpp"
#include "modules/builtin_modules.hpp"
#include "plugins/plugin_registry.hpp"
#include "session/session_manager.hpp"
#include "shell/script_runner.hpp"
#include "shell/shell_interpreter.hpp"
#include "test_support.hpp"
#include "tools/tool_catalog.hpp"

using penkit::ConfigStore;
using penkit::Logger;
using penkit::PathResolver;
using penkit::PluginRegistry;
using penkit::ScriptError;
using penkit::ScriptRunner;
using penkit::SessionManager;
using penkit::ShellInterpreter;
using penkit::ToolCatalog;
using penkit::test_support::contains;
using penkit::test_support::make_temp_dir;
using penkit::test_support::write_file;

namespace {

namespace fs = std::filesystem;

struct Fixture {
    fs::path dir{make_temp_dir("penkit_script_runner")};
    std::ostringstream log_sink;
    Logger logger{log_sink};
    ConfigStore config{(dir / "config.yaml").string()};
    PathResolver path_resolver;
    ToolCatalog tools{config, path_resolver, logger};
    PluginRegistry registry{logger};
    SessionManager sessions{registry, config, tools, logger};
    ShellInterpreter interpreter{sessions, config, registry, tools};
    ScriptRunner runner{interpreter};
    std::ostringstream out;
    std::ostringstream err;

    Fixture() {
        tools.add_builtin_tools();
        penkit::register_builtin_modules(registry);
    }

    ~Fixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    penkit::ScriptReport run(const std::string &script, bool continue_on_error = false) {
        std::istringstream input(script);
        return runner.run_stream(input, "test.pk", continue_on_error, out, err);
    }
};

void test_comments_and_blank_lines_are_skipped() {
    Fixture fixture;

    const auto report = fixture.run("# prepare the scan\n"
                                    "\n"
                                    "   \n"
                                    "  use port_scanner  \n"
                                    "\t# indented comment\n"
                                    "set target 10.0.0.5\n");

    assert(report.ok());
    assert(report.executed == 2);
    assert(!report.failed_line.has_value());
    assert(!report.exit_requested);
    assert(fixture.sessions.current().active()->options().get_string("target") == "10.0.0.5");
    assert(fixture.interpreter.history().size() == 2);
}

void test_stops_at_first_failure() {
    Fixture fixture;

    const auto report = fixture.run("use port_scanner\n"
                                    "# comment\n"
                                    "set timing fast\n"
                                    "set target 10.0.0.5\n");

    assert(!report.ok());
    assert(report.executed == 2);
    assert(report.failures == 1);
    assert(report.failed_line == 3u);
    assert(contains(fixture.err.str(), "script test.pk: line 3: command failed"));
    assert(fixture.sessions.current().active()->options().get_string("target").empty());
}

void test_continue_on_error_counts_failures() {
    Fixture fixture;

    const auto report = fixture.run("frobnicate\n"
                                    "use port_scanner\n"
                                    "set timing fast\n"
                                    "set target 10.0.0.5\n",
                                    true);

    assert(report.executed == 4);
    assert(report.failures == 2);
    assert(report.failed_line == 1u);
    assert(contains(fixture.err.str(), "script test.pk: 2 command(s) failed"));
    assert(!contains(fixture.err.str(), "command failed\n"));
    assert(fixture.sessions.current().active()->options().get_string("target") == "10.0.0.5");
}

void test_exit_stops_the_script() {
    Fixture fixture;

    const auto report = fixture.run("sessions create recon\n"
                                    "exit\n"
                                    "sessions create never\n");

    assert(report.ok());
    assert(report.exit_requested);
    assert(report.executed == 2);
    assert(fixture.sessions.current_id() == "recon");
    assert(fixture.sessions.list().size() == 2);
}

void test_run_file() {
    Fixture fixture;
    const auto script = fixture.dir / "setup.pk";
    write_file(script, "set -g target 10.0.0.7\nuse port_scanner\n");

    const auto report = fixture.runner.run_file(script.string(), false, fixture.out, fixture.err);
    assert(report.ok());
    assert(report.executed == 2);
    assert(fixture.sessions.current().active()->options().get_string("target") == "10.0.0.7");

    bool threw = false;
    try {
        (void)fixture.runner.run_file((fixture.dir / "missing.pk").string(), false, fixture.out, fixture.err);
    } catch (const ScriptError &error) {
        threw = true;
        assert(contains(error.what(), "missing.pk"));
    }
    assert(threw);
}

} // namespace

int main() {
    test_comments_and_blank_lines_are_skipped();
    test_stops_at_first_failure();
    test_continue_on_error_counts_failures();
    test_exit_stops_the_script();
    test_run_file();

    return 0;
}
