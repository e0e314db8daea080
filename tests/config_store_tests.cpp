#include <cassert>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"

using penkit::ConfigError;
using penkit::ConfigLayer;
using penkit::ConfigStore;
using penkit::UnknownKeyError;
using penkit::test_support::EnvVarGuard;
using penkit::test_support::make_temp_dir;
using penkit::test_support::slurp;
using penkit::test_support::write_file;

namespace {

namespace fs = std::filesystem;

void test_defaults_without_a_file() {
    const fs::path dir = make_temp_dir("penkit_config");
    ConfigStore config((dir / "config.yaml").string());
    config.load();

    assert(config.get_int("tools.default_timeout") == 600);
    assert(config.get_string("tools.container_runtime") == "docker");
    assert(!config.get_bool("debug"));
    assert(config.entry("log.level").source == ConfigLayer::Default);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_user_file_overrides_defaults() {
    const fs::path dir = make_temp_dir("penkit_config");
    const fs::path file = dir / "config.yaml";
    write_file(file, "tools:\n  default_timeout: 30\n  nmap:\n    use_container: yes\nlog:\n  file:\n");

    ConfigStore config(file.string());
    config.load();

    assert(config.get_int("tools.default_timeout") == 30);
    assert(config.get_bool("tools.nmap.use_container"));
    assert(config.get_string("log.file").empty());
    assert(config.entry("tools.default_timeout").source == ConfigLayer::User);
    assert(config.entry("debug").source == ConfigLayer::Default);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_load_rejects_unknown_keys_and_bad_types() {
    const fs::path dir = make_temp_dir("penkit_config");
    const fs::path file = dir / "config.yaml";

    write_file(file, "tools:\n  colour: blue\n");
    bool unknown = false;
    try {
        ConfigStore config(file.string());
        config.load();
    } catch (const ConfigError &error) {
        unknown = std::string(error.what()).find("tools.colour") != std::string::npos;
    }
    assert(unknown);

    write_file(file, "tools:\n  default_timeout: soon\n");
    bool mismatch = false;
    try {
        ConfigStore config(file.string());
        config.load();
    } catch (const ConfigError &) {
        mismatch = true;
    }
    assert(mismatch);

    write_file(file, "debug: [true\n");
    bool corrupt = false;
    try {
        ConfigStore config(file.string());
        config.load();
    } catch (const ConfigError &) {
        corrupt = true;
    }
    assert(corrupt);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_get_and_set_validate_keys() {
    const fs::path dir = make_temp_dir("penkit_config");
    ConfigStore config((dir / "config.yaml").string());

    bool unknown = false;
    try {
        (void)config.get("tools.colour");
    } catch (const UnknownKeyError &) {
        unknown = true;
    }
    assert(unknown);

    bool mismatch = false;
    try {
        config.set("tools.default_timeout", "ten");
    } catch (const ConfigError &) {
        mismatch = true;
    }
    assert(mismatch);
    assert(config.get_int("tools.default_timeout") == 600);

    bool wrong_accessor = false;
    try {
        (void)config.get_bool("tools.default_timeout");
    } catch (const ConfigError &) {
        wrong_accessor = true;
    }
    assert(wrong_accessor);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_default_timeout_is_bounded() {
    const fs::path dir = make_temp_dir("penkit_config");
    const fs::path file = dir / "config.yaml";
    ConfigStore config(file.string());

    for (const char *text : {"0", "-30", "604801", "9223372036854775807"}) {
        bool rejected = false;
        try {
            config.set("tools.default_timeout", text);
        } catch (const ConfigError &error) {
            rejected = std::string(error.what()).find("between 1 and 604800") != std::string::npos;
        }
        assert(rejected);
    }
    assert(config.get_int("tools.default_timeout") == 600);

    bool rejected_value = false;
    try {
        config.set_value("tools.default_timeout", std::int64_t{0});
    } catch (const ConfigError &) {
        rejected_value = true;
    }
    assert(rejected_value);

    config.set("tools.default_timeout", "1");
    config.set("tools.default_timeout", "604800");
    assert(config.get_int("tools.default_timeout") == 604800);

    write_file(file, "tools:\n  default_timeout: 0\n");
    bool rejected_file = false;
    try {
        ConfigStore loaded(file.string());
        loaded.load();
    } catch (const ConfigError &error) {
        rejected_file = std::string(error.what()).find("tools.default_timeout") != std::string::npos;
    }
    assert(rejected_file);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_runtime_set_is_lost_without_save() {
    const fs::path dir = make_temp_dir("penkit_config");
    const std::string file = (dir / "config.yaml").string();

    {
        ConfigStore config(file);
        config.load();
        config.set("tools.default_timeout", "120");
        assert(config.get_int("tools.default_timeout") == 120);
        assert(config.entry("tools.default_timeout").source == ConfigLayer::Runtime);
        assert(config.has_unsaved_changes());
    }

    ConfigStore restarted(file);
    restarted.load();
    assert(restarted.get_int("tools.default_timeout") == 600);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_save_persists_and_keeps_other_entries() {
    const fs::path dir = make_temp_dir("penkit_config");
    const fs::path file = dir / "nested" / "config.yaml";

    fs::create_directories(file.parent_path());
    write_file(file, "debug: true\ntools:\n  nmap:\n    path: /opt/nmap/bin/nmap\n");

    {
        ConfigStore config(file.string());
        config.load();
        config.set("tools.default_timeout", "120");
        config.set("tools.nmap.use_container", "true");
        config.save();

        assert(!config.has_unsaved_changes());
        assert(config.get_int("tools.default_timeout") == 120);
    }

    ConfigStore restarted(file.string());
    restarted.load();
    assert(restarted.get_int("tools.default_timeout") == 120);
    assert(restarted.get_bool("tools.nmap.use_container"));
    assert(restarted.get_bool("debug"));
    assert(restarted.get_string("tools.nmap.path") == "/opt/nmap/bin/nmap");
    assert(restarted.entry("tools.default_timeout").source == ConfigLayer::User);

    const YAML::Node saved = YAML::Load(slurp(file));
    assert(saved["tools"]["default_timeout"].as<int>() == 120);

    for (const auto &entry : fs::directory_iterator(file.parent_path())) {
        assert(entry.path().filename() == "config.yaml");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_expand_home() {
    EnvVarGuard guard("HOME");
    setenv("HOME", "/home/operator", 1);

    assert(penkit::expand_home("~/.penkit/plugins") == "/home/operator/.penkit/plugins");
    assert(penkit::expand_home("~") == "/home/operator");
    assert(penkit::expand_home("/etc/penkit") == "/etc/penkit");
    assert(penkit::expand_home("~other/x") == "~other/x");
}

} // namespace

int main() {
    test_defaults_without_a_file();
    test_user_file_overrides_defaults();
    test_load_rejects_unknown_keys_and_bad_types();
    test_get_and_set_validate_keys();
    test_default_timeout_is_bounded();
    test_runtime_set_is_lost_without_save();
    test_save_persists_and_keeps_other_entries();
    test_expand_home();

    return 0;
}
