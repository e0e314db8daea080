#include "config/config_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <span>
#include <sstream>
#include <system_error>
#include <utility>

#include <unistd.h>

#include <yaml-cpp/yaml.h>

#include "core/errors.hpp"
#include "execution/process_executor.hpp"

namespace penkit {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::vector<std::string> split_key(std::string_view key) {
    std::vector<std::string> parts;
    std::string part;
    std::stringstream stream{std::string(key)};

    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }

    return parts;
}

void assign_path(YAML::Node node, std::span<const std::string> parts, const Value &value) {
    const std::string &head = parts.front();

    if (parts.size() == 1) {
        if (const auto *flag = std::get_if<bool>(&value)) {
            node[head] = *flag;
        } else if (const auto *number = std::get_if<std::int64_t>(&value)) {
            node[head] = *number;
        } else {
            node[head] = std::get<std::string>(value);
        }
        return;
    }

    if (!node[head].IsMap()) {
        node[head] = YAML::Node(YAML::NodeType::Map);
    }

    assign_path(node[head], parts.subspan(1), value);
}

[[nodiscard]] YAML::Node load_document(const std::string &path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &error) {
        throw ConfigError("cannot read configuration file '" + path + "': " + error.what());
    }

    if (root.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }

    if (!root.IsMap()) {
        throw ConfigError("configuration file '" + path + "' must contain a mapping");
    }

    return root;
}

void check_range(const ConfigSchemaEntry &schema, const Value &value) {
    const auto *number = std::get_if<std::int64_t>(&value);
    if (number == nullptr) {
        return;
    }

    if (*number < schema.min_int || *number > schema.max_int) {
        throw ConfigError(schema.key + " must be between " + std::to_string(schema.min_int) + " and " +
                          std::to_string(schema.max_int) + ", got " + std::to_string(*number));
    }
}

} // namespace

std::string_view layer_name(ConfigLayer layer) noexcept {
    switch (layer) {
    case ConfigLayer::Default:
        return "default";
    case ConfigLayer::User:
        return "user";
    case ConfigLayer::Runtime:
        return "runtime";
    }

    return "default";
}

std::string expand_home(std::string_view path) {
    if (path == "~" || path.starts_with("~/")) {
        const char *home = std::getenv("HOME");
        return std::string(home != nullptr ? home : "") + std::string(path.substr(1));
    }

    return std::string(path);
}

ConfigStore::ConfigStore(std::string user_file_path)
    : ConfigStore(std::move(user_file_path), default_schema()) {}

ConfigStore::ConfigStore(std::string user_file_path, std::vector<ConfigSchemaEntry> schema)
    : user_file_path_(std::move(user_file_path)), schema_(std::move(schema)) {}

const std::vector<ConfigSchemaEntry> &ConfigStore::default_schema() {
    static const std::vector<ConfigSchemaEntry> schema{
        {"debug", ValueType::Bool, Value{false}, "Enable debug logging"},
        {"log.level", ValueType::String, Value{std::string("info")}, "debug, info, warning or error"},
        {"log.file", ValueType::String, Value{std::string()}, "Append log lines to this file"},
        {"shell.history_file", ValueType::String, Value{std::string("~/.penkit/history")}, "Interactive input history"},
        {"shell.script_continue_on_error", ValueType::Bool, Value{false}, "Keep running a script after a failed command"},
        {"plugins.path", ValueType::String, Value{std::string("~/.penkit/plugins")}, "Directory scanned for plugin manifests"},
        {"sessions.path", ValueType::String, Value{std::string("~/.penkit/sessions")}, "Directory for archived results"},
        {"sessions.save_results", ValueType::Bool, Value{false}, "Archive every execution result as YAML"},
        {"tools.container_runtime", ValueType::String, Value{std::string("docker")}, "Container runtime binary"},
        {"tools.default_timeout",
         ValueType::Int,
         Value{std::int64_t{600}},
         "Tool timeout in seconds",
         1,
         max_tool_timeout.count()},
        {"tools.nmap.path", ValueType::String, Value{std::string()}, "Explicit nmap binary"},
        {"tools.nmap.use_container", ValueType::Bool, Value{false}, "Always run nmap in a container"},
        {"tools.nmap.container_image", ValueType::String, Value{std::string("instrumentisto/nmap:latest")}, "nmap image"},
        {"tools.sqlmap.path", ValueType::String, Value{std::string()}, "Explicit sqlmap binary"},
        {"tools.sqlmap.use_container", ValueType::Bool, Value{false}, "Always run sqlmap in a container"},
        {"tools.sqlmap.container_image",
         ValueType::String,
         Value{std::string("vulnerables/sqlmap-python3")},
         "sqlmap image"},
    };

    return schema;
}

std::string ConfigStore::default_user_file() { return expand_home("~/.penkit/config.yaml"); }

void ConfigStore::load() {
    const YAML::Node root = load_document(user_file_path_);
    Layer loaded;

    std::function<void(const YAML::Node &, const std::string &)> flatten =
        [&](const YAML::Node &node, const std::string &prefix) {
            for (const auto &item : node) {
                const std::string key = prefix.empty() ? item.first.as<std::string>()
                                                       : prefix + "." + item.first.as<std::string>();
                const YAML::Node &child = item.second;

                if (child.IsMap()) {
                    flatten(child, key);
                    continue;
                }

                if (!contains(key)) {
                    throw ConfigError("unknown configuration key '" + key + "' in " + user_file_path_);
                }

                const auto &schema = schema_entry(key);

                if (child.IsNull() && schema.type == ValueType::String) {
                    loaded[key] = Value{std::string()};
                    continue;
                }

                if (!child.IsScalar()) {
                    throw ConfigError("configuration key '" + key + "' must be a " +
                                      std::string(type_name(schema.type)));
                }

                auto value = coerce_value(schema.type, child.Scalar());
                if (!value.has_value()) {
                    throw ConfigError("configuration key '" + key + "': " + value.error());
                }

                check_range(schema, *value);
                loaded[key] = std::move(*value);
            }
        };

    try {
        flatten(root, "");
    } catch (const YAML::Exception &error) {
        throw ConfigError("malformed configuration file '" + user_file_path_ + "': " + error.what());
    }

    user_layer_ = std::move(loaded);
}

void ConfigStore::save() {
    YAML::Node root = load_document(user_file_path_);

    for (const auto &[key, value] : runtime_layer_) {
        const auto parts = split_key(key);
        assign_path(root, parts, value);
    }

    const fs::path target(user_file_path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ConfigError("cannot create directory for '" + user_file_path_ + "': " + ec.message());
        }
    }

    std::string pattern = user_file_path_ + ".tmp.XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = mkstemp(buffer.data());
    if (fd == -1) {
        throw ConfigError("cannot create temporary file next to '" + user_file_path_ + "'");
    }
    close(fd);

    const std::string temp_path(buffer.data());

    YAML::Emitter emitter;
    emitter << root;

    {
        std::ofstream file(temp_path, std::ios::trunc);
        file << emitter.c_str() << '\n';
        file.flush();

        if (!file.good()) {
            fs::remove(temp_path, ec);
            throw ConfigError("failed to write configuration to '" + temp_path + "'");
        }
    }

    fs::rename(temp_path, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        throw ConfigError("failed to replace '" + user_file_path_ + "': " + ec.message());
    }

    for (auto &[key, value] : runtime_layer_) {
        user_layer_[key] = value;
    }
}

bool ConfigStore::contains(std::string_view key) const {
    for (const auto &entry : schema_) {
        if (entry.key == key) {
            return true;
        }
    }

    return false;
}

const ConfigSchemaEntry &ConfigStore::schema_entry(std::string_view key) const {
    for (const auto &entry : schema_) {
        if (entry.key == key) {
            return entry;
        }
    }

    throw UnknownKeyError("unknown configuration key '" + std::string(key) + "'");
}

Value ConfigStore::get(std::string_view key) const { return entry(key).value; }

bool ConfigStore::get_bool(std::string_view key) const {
    const auto value = get(key);
    if (const auto *flag = std::get_if<bool>(&value)) {
        return *flag;
    }

    throw ConfigError("configuration key '" + std::string(key) + "' is not a bool");
}

std::int64_t ConfigStore::get_int(std::string_view key) const {
    const auto value = get(key);
    if (const auto *number = std::get_if<std::int64_t>(&value)) {
        return *number;
    }

    throw ConfigError("configuration key '" + std::string(key) + "' is not an int");
}

std::string ConfigStore::get_string(std::string_view key) const {
    const auto value = get(key);
    if (const auto *text = std::get_if<std::string>(&value)) {
        return *text;
    }

    throw ConfigError("configuration key '" + std::string(key) + "' is not a string");
}

void ConfigStore::set(std::string_view key, std::string_view text) {
    const auto &schema = schema_entry(key);

    auto value = coerce_value(schema.type, text);
    if (!value.has_value()) {
        throw ConfigError(std::string(key) + ": " + value.error());
    }

    check_range(schema, *value);
    runtime_layer_[schema.key] = std::move(*value);
}

void ConfigStore::set_value(std::string_view key, const Value &value) {
    const auto &schema = schema_entry(key);

    if (type_of(value) != schema.type) {
        throw ConfigError(std::string(key) + ": expected a " + std::string(type_name(schema.type)));
    }

    check_range(schema, value);
    runtime_layer_[schema.key] = value;
}

ConfigEntry ConfigStore::entry(std::string_view key) const {
    const auto &schema = schema_entry(key);

    if (auto it = runtime_layer_.find(key); it != runtime_layer_.end()) {
        return ConfigEntry{schema.key, schema.type, it->second, ConfigLayer::Runtime};
    }

    if (auto it = user_layer_.find(key); it != user_layer_.end()) {
        return ConfigEntry{schema.key, schema.type, it->second, ConfigLayer::User};
    }

    return ConfigEntry{schema.key, schema.type, schema.default_value, ConfigLayer::Default};
}

std::vector<ConfigEntry> ConfigStore::entries() const {
    std::vector<ConfigEntry> result;
    result.reserve(schema_.size());

    for (const auto &schema : schema_) {
        result.push_back(entry(schema.key));
    }

    return result;
}

bool ConfigStore::has_unsaved_changes() const noexcept {
    for (const auto &[key, value] : runtime_layer_) {
        auto it = user_layer_.find(key);
        if (it == user_layer_.end() || it->second != value) {
            return true;
        }
    }

    return false;
}

const std::string &ConfigStore::user_file_path() const noexcept { return user_file_path_; }

} // namespace penkit
