#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "core/path_resolver.hpp"
#include "log/logger.hpp"
#include "test_support.hpp"
#include "tools/output_parser.hpp"
#include "tools/tool_catalog.hpp"
#include "tools/tool_integration.hpp"

using penkit::ConfigStore;
using penkit::DuplicateNameError;
using penkit::ExecutionMode;
using penkit::ExecutionRoute;
using penkit::ExecutionTimeoutError;
using penkit::Logger;
using penkit::NmapGrepableParser;
using penkit::PathResolver;
using penkit::RawLinesParser;
using penkit::ToolCatalog;
using penkit::ToolDescriptor;
using penkit::ToolIntegration;
using penkit::ToolNotFoundError;
using penkit::test_support::contains;
using penkit::test_support::EnvVarGuard;
using penkit::test_support::make_executable_script;
using penkit::test_support::make_temp_dir;
using penkit::test_support::slurp;
using penkit::test_support::use_path;

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

constexpr const char *fake_nmap_body = "#!/bin/sh\n"
                                       "if [ \"$1\" = \"--version\" ]; then echo 'Nmap version 7.94 ( https://nmap.org )'; "
                                       "echo 'Platform: x86_64'; exit 0; fi\n"
                                       "printf '%s\\n' \"$@\" > \"$(dirname \"$0\")/args.txt\"\n"
                                       "printf '# Nmap 7.94 scan initiated\\n'\n"
                                       "printf 'Host: 10.0.0.5 ()\\tPorts: 22/open/tcp//ssh///\\n'\n";

// Prints every argument on its own line.
constexpr const char *fake_runtime_body = "#!/bin/sh\nprintf '%s\\n' \"$@\"\n";

struct Fixture {
    EnvVarGuard path_guard{"PATH"};
    fs::path dir{make_temp_dir("penkit_tool_integration")};
    std::ostringstream log_sink;
    Logger logger{log_sink, penkit::LogLevel::Debug};
    ConfigStore config{(dir / "config.yaml").string()};
    PathResolver path_resolver;

    Fixture() { use_path(dir); }

    ~Fixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

ToolDescriptor custom_tool(std::string binary, ExecutionMode mode) {
    return ToolDescriptor{
        .name = "whois",
        .binary_name = std::move(binary),
        .version_args = {"--version"},
        .default_args = {"-H"},
        .container_image = "penkit/whois:latest",
        .container_options = {"--net=host", "-v", "/tmp:/data"},
        .mode = mode,
    };
}

void test_native_execution_through_path() {
    Fixture fixture;
    make_executable_script(fixture.dir / "nmap", fake_nmap_body);

    ToolIntegration nmap(penkit::nmap_descriptor(), std::make_unique<NmapGrepableParser>(), fixture.config,
                         fixture.path_resolver, fixture.logger);
    const auto output = nmap.execute({"-oG", "-", "10.0.0.5"}, 5s);

    assert(output.route == ExecutionRoute::Native);
    assert(output.exit_code == 0);
    assert(output.payload["parsed"].as<bool>());
    assert(output.payload["result"].as<std::string>() == "1 host(s) up, 1 open port(s)");
    assert(contains(output.command, (fixture.dir / "nmap").string()));
    assert(slurp(fixture.dir / "args.txt") == "-oG\n-\n10.0.0.5\n");
}

void test_configured_path_wins_over_path_lookup() {
    Fixture fixture;
    const fs::path other = fixture.dir / "opt";
    fs::create_directories(other);
    make_executable_script(other / "nmap-custom", fake_nmap_body);

    fixture.config.set("tools.nmap.path", (other / "nmap-custom").string());
    ToolIntegration nmap(penkit::nmap_descriptor(), std::make_unique<NmapGrepableParser>(), fixture.config,
                         fixture.path_resolver, fixture.logger);

    const auto output = nmap.execute({"10.0.0.5"}, 5s);
    assert(output.route == ExecutionRoute::Native);
    assert(slurp(other / "args.txt") == "10.0.0.5\n");
    assert(nmap.describe_route() == "native " + (other / "nmap-custom").string());
}

void test_container_fallback_builds_runtime_command() {
    Fixture fixture;
    make_executable_script(fixture.dir / "penkit-fake-runtime", fake_runtime_body);
    fixture.config.set("tools.container_runtime", "penkit-fake-runtime");

    ToolIntegration whois(custom_tool("penkit-absent-whois", ExecutionMode::Auto), std::make_unique<RawLinesParser>(),
                          fixture.config, fixture.path_resolver, fixture.logger);
    const auto output = whois.execute({"example.com"}, 5s);

    assert(output.route == ExecutionRoute::Container);
    assert(output.standard_output == "run\n--rm\n--net=host\n-v\n/tmp:/data\npenkit/whois:latest\n-H\nexample.com\n");
    assert(whois.describe_route() == "container penkit/whois:latest");
    assert(!whois.version().has_value());
}

void test_use_container_config_forces_container() {
    Fixture fixture;
    make_executable_script(fixture.dir / "nmap", fake_nmap_body);
    make_executable_script(fixture.dir / "penkit-fake-runtime", fake_runtime_body);
    fixture.config.set("tools.container_runtime", "penkit-fake-runtime");
    fixture.config.set("tools.nmap.use_container", "true");
    fixture.config.set("tools.nmap.container_image", "mirror.local/nmap:7.94");

    ToolIntegration nmap(penkit::nmap_descriptor(), std::make_unique<RawLinesParser>(), fixture.config,
                         fixture.path_resolver, fixture.logger);
    const auto output = nmap.execute({"10.0.0.5"}, 5s);

    assert(output.route == ExecutionRoute::Container);
    assert(output.standard_output == "run\n--rm\n--net=host\nmirror.local/nmap:7.94\n10.0.0.5\n");
    assert(!fs::exists(fixture.dir / "args.txt"));
}

void test_container_mode_descriptor_without_config_key() {
    Fixture fixture;
    make_executable_script(fixture.dir / "whois", "#!/bin/sh\necho native\n");
    make_executable_script(fixture.dir / "penkit-fake-runtime", fake_runtime_body);
    fixture.config.set("tools.container_runtime", "penkit-fake-runtime");

    ToolIntegration whois(custom_tool("whois", ExecutionMode::Container), nullptr, fixture.config,
                          fixture.path_resolver, fixture.logger);
    const auto output = whois.execute({}, 5s);

    assert(output.route == ExecutionRoute::Container);
    assert(output.payload["parsed"].as<bool>());
    assert(output.payload["lines"][0].as<std::string>() == "run");
}

void test_unavailable_tool_throws() {
    Fixture fixture;

    ToolIntegration native_only(custom_tool("penkit-absent-whois", ExecutionMode::Native), nullptr, fixture.config,
                                fixture.path_resolver, fixture.logger);
    bool native_missing = false;
    try {
        (void)native_only.execute({}, 1s);
    } catch (const ToolNotFoundError &error) {
        native_missing = contains(error.what(), "penkit-absent-whois");
    }
    assert(native_missing);
    assert(contains(native_only.describe_route(), "unavailable"));

    fixture.config.set("tools.container_runtime", "penkit-absent-runtime");
    ToolIntegration no_runtime(custom_tool("penkit-absent-whois", ExecutionMode::Auto), nullptr, fixture.config,
                               fixture.path_resolver, fixture.logger);
    bool runtime_missing = false;
    try {
        (void)no_runtime.execute({}, 1s);
    } catch (const ToolNotFoundError &error) {
        runtime_missing = contains(error.what(), "penkit-absent-runtime");
    }
    assert(runtime_missing);
}

void test_nonzero_exit_is_reported_not_thrown() {
    Fixture fixture;
    make_executable_script(fixture.dir / "whois", "#!/bin/sh\necho 'no match' >&2\nexit 2\n");

    ToolIntegration whois(custom_tool("whois", ExecutionMode::Native), nullptr, fixture.config, fixture.path_resolver,
                          fixture.logger);
    const auto output = whois.execute({"example.invalid"}, 5s);

    assert(output.exit_code == 2);
    assert(output.standard_error == "no match\n");
    assert(output.payload["stderr"].as<std::string>() == "no match");
}

void test_timeout_carries_partial_output() {
    Fixture fixture;
    make_executable_script(fixture.dir / "whois", "#!/bin/sh\necho partial\nsleep 5\necho never\n");

    ToolIntegration whois(custom_tool("whois", ExecutionMode::Native), nullptr, fixture.config, fixture.path_resolver,
                          fixture.logger);

    const auto started = std::chrono::steady_clock::now();
    bool timed_out = false;
    try {
        (void)whois.execute({}, 1s);
    } catch (const ExecutionTimeoutError &error) {
        timed_out = error.partial_stdout() == "partial\n" && contains(error.what(), "timed out after 1s");
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(timed_out);
    assert(elapsed < 3s);
    assert(contains(fixture.log_sink.str(), "[warning] whois timed out"));
}

void test_version_reports_first_line() {
    Fixture fixture;
    make_executable_script(fixture.dir / "nmap", fake_nmap_body);

    ToolIntegration nmap(penkit::nmap_descriptor(), nullptr, fixture.config, fixture.path_resolver, fixture.logger);
    assert(nmap.version() == "Nmap version 7.94 ( https://nmap.org )");
}

void test_quote_command() {
    assert(penkit::quote_command({"sqlmap", "-u", "http://x/?a=1&b=2"}) == "sqlmap -u http://x/?a=1&b=2");
    assert(penkit::quote_command({"sqlmap", "--data", "a b", ""}) == "sqlmap --data 'a b' ''");
    assert(penkit::quote_command({"echo", "it's"}) == R"(echo 'it'\''s')");
}

void test_catalog() {
    Fixture fixture;
    ToolCatalog catalog(fixture.config, fixture.path_resolver, fixture.logger);
    catalog.add_builtin_tools();

    assert(catalog.contains("nmap"));
    assert(catalog.contains("sqlmap"));
    assert(catalog.get("sqlmap").descriptor().default_args == std::vector<std::string>({"--batch"}));
    assert(catalog.list().size() == 2);

    bool duplicate = false;
    try {
        catalog.add(penkit::nmap_descriptor(), nullptr);
    } catch (const DuplicateNameError &) {
        duplicate = true;
    }
    assert(duplicate);
    assert(catalog.list().size() == 2);

    bool unknown = false;
    try {
        (void)catalog.get("nikto");
    } catch (const ToolNotFoundError &) {
        unknown = true;
    }
    assert(unknown);
}

} // namespace

int main() {
    test_native_execution_through_path();
    test_configured_path_wins_over_path_lookup();
    test_container_fallback_builds_runtime_command();
    test_use_container_config_forces_container();
    test_container_mode_descriptor_without_config_key();
    test_unavailable_tool_throws();
    test_nonzero_exit_is_reported_not_thrown();
    test_timeout_carries_partial_output();
    test_version_reports_first_line();
    test_quote_command();
    test_catalog();

    return 0;
}
