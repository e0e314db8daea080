#include "core/value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace penkit {

namespace {

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

} // namespace

std::string_view type_name(ValueType type) noexcept {
    switch (type) {
    case ValueType::Bool:
        return "bool";
    case ValueType::Int:
        return "int";
    case ValueType::String:
        return "string";
    }

    return "string";
}

std::optional<ValueType> type_from_name(std::string_view name) noexcept {
    if (name == "bool") {
        return ValueType::Bool;
    }

    if (name == "int") {
        return ValueType::Int;
    }

    if (name == "string") {
        return ValueType::String;
    }

    return std::nullopt;
}

ValueType type_of(const Value &value) noexcept {
    if (std::holds_alternative<bool>(value)) {
        return ValueType::Bool;
    }

    if (std::holds_alternative<std::int64_t>(value)) {
        return ValueType::Int;
    }

    return ValueType::String;
}

std::expected<Value, std::string> coerce_value(ValueType type, std::string_view text) {
    switch (type) {
    case ValueType::Bool: {
        const auto lowered = lowercase(text);
        if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
            return Value{true};
        }

        if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
            return Value{false};
        }

        return std::unexpected("expected a boolean, got '" + std::string(text) + "'");
    }
    case ValueType::Int: {
        std::int64_t parsed = 0;
        const char *first = text.data();
        const char *last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);

        if (text.empty() || ec != std::errc{} || ptr != last) {
            return std::unexpected("expected an integer, got '" + std::string(text) + "'");
        }

        return Value{parsed};
    }
    case ValueType::String:
        return Value{std::string(text)};
    }

    return std::unexpected(std::string("unsupported value type"));
}

std::string to_string(const Value &value) {
    if (const auto *flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }

    if (const auto *number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }

    return std::get<std::string>(value);
}

} // namespace penkit
