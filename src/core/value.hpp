#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace penkit {

enum class ValueType {
    Bool,
    Int,
    String,
};

using Value = std::variant<bool, std::int64_t, std::string>;

[[nodiscard]] std::string_view type_name(ValueType type) noexcept;
[[nodiscard]] std::optional<ValueType> type_from_name(std::string_view name) noexcept;
[[nodiscard]] ValueType type_of(const Value &value) noexcept;

// Accepts true/false, yes/no, on/off and 1/0 for booleans.
[[nodiscard]] std::expected<Value, std::string> coerce_value(ValueType type, std::string_view text);

[[nodiscard]] std::string to_string(const Value &value);

} // namespace penkit
