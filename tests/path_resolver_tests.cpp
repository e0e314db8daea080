#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "core/path_resolver.hpp"
#include "test_support.hpp"

using penkit::PathResolver;
using penkit::test_support::EnvVarGuard;
using penkit::test_support::make_executable;
using penkit::test_support::make_temp_dir;
using penkit::test_support::write_file;

namespace {

namespace fs = std::filesystem;

void test_unset_path_returns_no_matches() {
    EnvVarGuard guard("PATH");
    unsetenv("PATH");

    PathResolver resolver;
    assert(resolver.find_command_path("nmap").empty());
}

void test_find_command_path_ignores_non_executables() {
    EnvVarGuard guard("PATH");

    const fs::path dir1 = make_temp_dir("penkit_path_resolver");
    const fs::path dir2 = make_temp_dir("penkit_path_resolver");

    const fs::path non_executable = dir1 / "fake_nmap";
    const fs::path executable = dir2 / "fake_nmap";

    write_file(non_executable, "#!/bin/sh\necho nonexec\n");
    write_file(executable, "#!/bin/sh\necho exec\n");

    std::error_code ec;
    fs::permissions(non_executable,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);

    make_executable(executable);

    const std::string path_env = dir1.string() + ":/definitely/missing/path:" + dir2.string();
    setenv("PATH", path_env.c_str(), 1);

    PathResolver resolver;
    assert(resolver.find_command_path("fake_nmap") == executable.string());
    assert(resolver.find_command_path("fake").empty());

    fs::remove_all(dir1, ec);
    fs::remove_all(dir2, ec);
}

void test_paths_with_slash_are_checked_directly() {
    const fs::path dir = make_temp_dir("penkit_path_resolver");
    const fs::path tool = dir / "sqlmap.py";
    const fs::path subdir = dir / "nested";

    write_file(tool, "#!/bin/sh\nexit 0\n");
    make_executable(tool);

    std::error_code ec;
    fs::create_directory(subdir, ec);
    assert(!ec);

    PathResolver resolver;
    assert(resolver.find_command_path(tool.string()) == tool.string());
    assert(resolver.find_command_path((dir / "missing").string()).empty());
    assert(!PathResolver::is_executable(subdir.string()));
    assert(PathResolver::is_executable(tool.string()));

    fs::remove_all(dir, ec);
}

void test_safe_path_components() {
    using penkit::is_safe_path_component;

    assert(is_safe_path_component("default"));
    assert(is_safe_path_component("lab-2.internal_a"));
    assert(is_safe_path_component(".hidden"));

    assert(!is_safe_path_component(""));
    assert(!is_safe_path_component("."));
    assert(!is_safe_path_component(".."));
    assert(!is_safe_path_component("../escape"));
    assert(!is_safe_path_component("/tmp"));
    assert(!is_safe_path_component("a\\b"));
    assert(!is_safe_path_component("two words"));
    assert(!is_safe_path_component(std::string_view("a\0b", 3)));
}

} // namespace

int main() {
    test_unset_path_returns_no_matches();
    test_find_command_path_ignores_non_executables();
    test_paths_with_slash_are_checked_directly();
    test_safe_path_components();
    return 0;
}
