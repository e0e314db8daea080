#include <cassert>
#include <filesystem>
#include <string>
#include <system_error>

#include <readline/history.h>

#include "history/history_manager.hpp"
#include "test_support.hpp"

using penkit::HistoryManager;
using penkit::test_support::contains;
using penkit::test_support::make_temp_dir;
using penkit::test_support::slurp;
using penkit::test_support::write_file;

namespace {

namespace fs = std::filesystem;

void reset_history() {
    using_history();
    clear_history();
}

void test_initialize_loads_existing_file_and_save_appends() {
    const fs::path dir = make_temp_dir("penkit_history");
    const fs::path history_file = dir / "history";
    write_file(history_file, "use port_scanner\n");

    reset_history();

    HistoryManager manager;
    manager.initialize(history_file.string());
    assert(manager.path() == history_file.string());

    assert(history_length == 1);
    assert(std::string(history_get(history_base)->line) == "use port_scanner");

    manager.record_input("set target 10.0.0.5");
    assert(manager.save());

    const auto content = slurp(history_file);
    assert(contains(content, "use port_scanner"));
    assert(contains(content, "set target 10.0.0.5"));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_save_creates_parent_directories() {
    const fs::path dir = make_temp_dir("penkit_history");
    const fs::path history_file = dir / "nested" / "deeper" / "history";

    reset_history();

    HistoryManager manager;
    manager.initialize(history_file.string());
    assert(history_length == 0);

    manager.record_input("show modules");
    assert(manager.save());
    assert(fs::exists(history_file));
    assert(contains(slurp(history_file), "show modules"));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_empty_path_disables_persistence() {
    reset_history();

    HistoryManager manager;
    manager.initialize("");
    manager.record_input("help");

    assert(manager.path().empty());
    assert(manager.save());
    assert(history_length == 1);
}

void test_record_input_deduplicates_consecutive_commands() {
    reset_history();
    HistoryManager manager;

    manager.record_input("");
    assert(history_length == 0);

    manager.record_input("run");
    assert(history_length == 1);

    manager.record_input("run");
    assert(history_length == 1);

    manager.record_input("show history");
    assert(history_length == 2);

    manager.record_input("run");
    assert(history_length == 3);
}

} // namespace

int main() {
    test_initialize_loads_existing_file_and_save_appends();
    test_save_creates_parent_directories();
    test_empty_path_disables_persistence();
    test_record_input_deduplicates_consecutive_commands();

    return 0;
}
