#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "core/value.hpp"

namespace penkit {

enum class ConfigLayer {
    Default,
    User,
    Runtime,
};

[[nodiscard]] std::string_view layer_name(ConfigLayer layer) noexcept;

struct ConfigSchemaEntry {
    std::string key;
    ValueType type;
    Value default_value;
    std::string description;
    // Inclusive bounds, checked for int entries only.
    std::int64_t min_int{std::numeric_limits<std::int64_t>::min()};
    std::int64_t max_int{std::numeric_limits<std::int64_t>::max()};
};

struct ConfigEntry {
    std::string key;
    ValueType type;
    Value value;
    ConfigLayer source;
};

// Replaces a leading "~/" with $HOME.
[[nodiscard]] std::string expand_home(std::string_view path);

class ConfigStore {
  public:
    explicit ConfigStore(std::string user_file_path);
    ConfigStore(std::string user_file_path, std::vector<ConfigSchemaEntry> schema);

    [[nodiscard]] static const std::vector<ConfigSchemaEntry> &default_schema();
    [[nodiscard]] static std::string default_user_file();

    // Missing file is fine. Throws ConfigError on unreadable YAML, unknown keys or type mismatches.
    void load();
    // Merges the runtime layer into the file, writing through a temporary file and rename.
    void save();

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] Value get(std::string_view key) const;
    [[nodiscard]] bool get_bool(std::string_view key) const;
    [[nodiscard]] std::int64_t get_int(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key) const;

    void set(std::string_view key, std::string_view text);
    void set_value(std::string_view key, const Value &value);

    [[nodiscard]] ConfigEntry entry(std::string_view key) const;
    [[nodiscard]] std::vector<ConfigEntry> entries() const;
    [[nodiscard]] bool has_unsaved_changes() const noexcept;

    [[nodiscard]] const std::string &user_file_path() const noexcept;

  private:
    using Layer = std::map<std::string, Value, std::less<>>;

    std::string user_file_path_;
    std::vector<ConfigSchemaEntry> schema_;
    Layer user_layer_;
    Layer runtime_layer_;

    [[nodiscard]] const ConfigSchemaEntry &schema_entry(std::string_view key) const;
};

} // namespace penkit
