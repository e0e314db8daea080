#include "plugins/option_set.hpp"

#include <utility>

#include "core/errors.hpp"

namespace penkit {

OptionSet::OptionSet(OptionSchema schema) : schema_(std::move(schema)) {
    values_.reserve(schema_.size());

    for (const auto &spec : schema_) {
        values_.push_back(spec.default_value);
    }
}

std::size_t OptionSet::index_of(std::string_view name) const {
    for (std::size_t i = 0; i < schema_.size(); ++i) {
        if (schema_[i].name == name) {
            return i;
        }
    }

    throw InvalidOptionError("unknown option '" + std::string(name) + "'");
}

void OptionSet::set(std::string_view name, std::string_view text) {
    const auto index = index_of(name);
    const auto &spec = schema_[index];

    auto value = coerce_value(spec.type, text);
    if (!value.has_value()) {
        throw InvalidOptionError(spec.name + ": " + value.error());
    }

    values_[index] = std::move(*value);
}

void OptionSet::set_value(std::string_view name, const Value &value) {
    const auto index = index_of(name);
    const auto &spec = schema_[index];

    if (type_of(value) != spec.type) {
        throw InvalidOptionError(spec.name + ": expected a " + std::string(type_name(spec.type)));
    }

    values_[index] = value;
}

void OptionSet::unset(std::string_view name) {
    const auto index = index_of(name);
    values_[index] = schema_[index].default_value;
}

bool OptionSet::declares(std::string_view name) const {
    for (const auto &spec : schema_) {
        if (spec.name == name) {
            return true;
        }
    }

    return false;
}

std::optional<Value> OptionSet::value(std::string_view name) const { return values_[index_of(name)]; }

std::string OptionSet::get_string(std::string_view name) const {
    const auto current = value(name);
    if (!current.has_value()) {
        return {};
    }

    if (const auto *text = std::get_if<std::string>(&*current)) {
        return *text;
    }

    return to_string(*current);
}

std::int64_t OptionSet::get_int(std::string_view name) const {
    const auto current = value(name);
    if (!current.has_value()) {
        throw InvalidOptionError(std::string(name) + " has no value");
    }

    if (const auto *number = std::get_if<std::int64_t>(&*current)) {
        return *number;
    }

    throw InvalidOptionError(std::string(name) + " is not an int");
}

bool OptionSet::get_bool(std::string_view name) const {
    const auto current = value(name);
    if (!current.has_value()) {
        return false;
    }

    if (const auto *flag = std::get_if<bool>(&*current)) {
        return *flag;
    }

    throw InvalidOptionError(std::string(name) + " is not a bool");
}

std::vector<std::string> OptionSet::missing_required() const {
    std::vector<std::string> missing;

    for (std::size_t i = 0; i < schema_.size(); ++i) {
        if (!schema_[i].required) {
            continue;
        }

        const auto &current = values_[i];
        const auto *text = current.has_value() ? std::get_if<std::string>(&*current) : nullptr;
        if (!current.has_value() || (text != nullptr && text->empty())) {
            missing.push_back(schema_[i].name);
        }
    }

    return missing;
}

std::vector<ResolvedOption> OptionSet::resolved() const {
    std::vector<ResolvedOption> result;
    result.reserve(schema_.size());

    for (std::size_t i = 0; i < schema_.size(); ++i) {
        const auto &spec = schema_[i];
        result.push_back(ResolvedOption{
            .name = spec.name,
            .type = spec.type,
            .value = values_[i],
            .required = spec.required,
            .description = spec.description,
        });
    }

    return result;
}

const OptionSchema &OptionSet::schema() const noexcept { return schema_; }

} // namespace penkit
