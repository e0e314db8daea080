#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

#include "log/logger.hpp"
#include "test_support.hpp"

using penkit::Logger;
using penkit::LogLevel;
using penkit::test_support::contains;
using penkit::test_support::make_temp_dir;
using penkit::test_support::slurp;

namespace {

namespace fs = std::filesystem;

void test_level_filtering() {
    std::ostringstream sink;
    Logger logger(sink);

    logger.debug("hidden");
    logger.info("registered plugin port_scanner");
    logger.warning("skipping plugin manifest");

    const auto text = sink.str();
    assert(!contains(text, "hidden"));
    assert(contains(text, "[info] registered plugin port_scanner\n"));
    assert(contains(text, "[warning] skipping plugin manifest\n"));

    sink.str("");
    logger.set_level(LogLevel::Error);
    logger.warning("quiet");
    assert(sink.str().empty());
}

void test_level_names() {
    assert(penkit::log_level_from_name("debug") == LogLevel::Debug);
    assert(penkit::log_level_from_name("warn") == LogLevel::Warning);
    assert(penkit::log_level_from_name("warning") == LogLevel::Warning);
    assert(!penkit::log_level_from_name("verbose").has_value());
}

void test_file_sink_appends_timestamped_lines() {
    const fs::path dir = make_temp_dir("penkit_logger");
    const fs::path file = dir / "penkit.log";

    std::ostringstream sink;
    Logger logger(sink, LogLevel::Debug);
    assert(logger.open_file(file.string()));

    logger.debug("nmap exited with code 0");
    logger.error("nmap timed out after 1s");

    const auto text = slurp(file);
    assert(contains(text, " [debug] nmap exited with code 0\n"));
    assert(contains(text, " [error] nmap timed out after 1s\n"));
    assert(text.front() >= '0' && text.front() <= '9');

    assert(!logger.open_file((dir / "missing" / "x.log").string()));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

} // namespace

int main() {
    test_level_filtering();
    test_level_names();
    test_file_sink_appends_timestamped_lines();

    return 0;
}
