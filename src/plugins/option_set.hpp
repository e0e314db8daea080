#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/value.hpp"

namespace penkit {

struct OptionSpec {
    std::string name;
    ValueType type{ValueType::String};
    std::optional<Value> default_value;
    bool required{false};
    std::string description;

    bool operator==(const OptionSpec &) const = default;
};

// Declaration order is display order.
using OptionSchema = std::vector<OptionSpec>;

struct ResolvedOption {
    std::string name;
    ValueType type;
    std::optional<Value> value;
    bool required;
    std::string description;
};

class OptionSet {
  public:
    explicit OptionSet(OptionSchema schema);

    // Both throw InvalidOptionError for undeclared names or values that do not coerce.
    void set(std::string_view name, std::string_view text);
    void set_value(std::string_view name, const Value &value);
    // Restores the schema default.
    void unset(std::string_view name);

    [[nodiscard]] bool declares(std::string_view name) const;
    [[nodiscard]] std::optional<Value> value(std::string_view name) const;

    [[nodiscard]] std::string get_string(std::string_view name) const;
    [[nodiscard]] std::int64_t get_int(std::string_view name) const;
    [[nodiscard]] bool get_bool(std::string_view name) const;

    // Required options without a value; an empty string counts as no value.
    [[nodiscard]] std::vector<std::string> missing_required() const;
    [[nodiscard]] std::vector<ResolvedOption> resolved() const;
    [[nodiscard]] const OptionSchema &schema() const noexcept;

    bool operator==(const OptionSet &) const = default;

  private:
    OptionSchema schema_;
    std::vector<std::optional<Value>> values_;

    [[nodiscard]] std::size_t index_of(std::string_view name) const;
};

} // namespace penkit
