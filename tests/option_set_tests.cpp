#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/value.hpp"
#include "plugins/option_set.hpp"

using penkit::coerce_value;
using penkit::InvalidOptionError;
using penkit::OptionSchema;
using penkit::OptionSet;
using penkit::Value;
using penkit::ValueType;

namespace {

OptionSchema scanner_schema() {
    return {
        {"target", ValueType::String, std::nullopt, true, "Host to scan"},
        {"ports", ValueType::String, Value{std::string("1-1000")}, false, "Ports"},
        {"timing", ValueType::Int, Value{std::int64_t{4}}, false, "Timing"},
        {"service_detection", ValueType::Bool, Value{true}, false, "Versions"},
        {"api_key", ValueType::String, Value{std::string()}, true, "Key"},
    };
}

void test_coerce_value_accepts_common_spellings() {
    assert(std::get<bool>(*coerce_value(ValueType::Bool, "yes")));
    assert(std::get<bool>(*coerce_value(ValueType::Bool, "ON")));
    assert(!std::get<bool>(*coerce_value(ValueType::Bool, "0")));
    assert(!coerce_value(ValueType::Bool, "maybe").has_value());

    assert(std::get<std::int64_t>(*coerce_value(ValueType::Int, "-12")) == -12);
    assert(!coerce_value(ValueType::Int, "12abc").has_value());
    assert(!coerce_value(ValueType::Int, "").has_value());

    assert(std::get<std::string>(*coerce_value(ValueType::String, " spaced ")) == " spaced ");
    assert(penkit::to_string(Value{false}) == "false");
}

void test_defaults_and_typed_getters() {
    OptionSet options(scanner_schema());

    assert(options.get_string("ports") == "1-1000");
    assert(options.get_int("timing") == 4);
    assert(options.get_bool("service_detection"));
    assert(!options.value("target").has_value());
    assert(options.get_string("target").empty());
}

void test_set_coerces_and_rejects() {
    OptionSet options(scanner_schema());

    options.set("timing", "2");
    assert(options.get_int("timing") == 2);

    options.set("service_detection", "false");
    assert(!options.get_bool("service_detection"));

    bool bad_type = false;
    try {
        options.set("timing", "fast");
    } catch (const InvalidOptionError &) {
        bad_type = true;
    }
    assert(bad_type);
    assert(options.get_int("timing") == 2);

    bool unknown = false;
    try {
        options.set("verbosity", "3");
    } catch (const InvalidOptionError &error) {
        unknown = std::string(error.what()).find("verbosity") != std::string::npos;
    }
    assert(unknown);
}

void test_unset_restores_default() {
    OptionSet options(scanner_schema());

    options.set("ports", "22,80");
    options.set("target", "10.0.0.5");
    options.unset("ports");
    options.unset("target");

    assert(options.get_string("ports") == "1-1000");
    assert(!options.value("target").has_value());
}

void test_missing_required_lists_every_unset_option() {
    OptionSet options(scanner_schema());

    assert(options.missing_required() == std::vector<std::string>({"target", "api_key"}));

    options.set("target", "10.0.0.5");
    assert(options.missing_required() == std::vector<std::string>({"api_key"}));

    options.set("api_key", "k");
    assert(options.missing_required().empty());

    options.set("target", "");
    assert(options.missing_required() == std::vector<std::string>({"target"}));
}

void test_resolved_follows_schema_order() {
    OptionSet options(scanner_schema());
    options.set("target", "scanme.nmap.org");

    const auto resolved = options.resolved();
    assert(resolved.size() == 5);
    assert(resolved[0].name == "target");
    assert(resolved[0].required);
    assert(std::get<std::string>(*resolved[0].value) == "scanme.nmap.org");
    assert(resolved[2].name == "timing");
    assert(resolved[2].type == ValueType::Int);
}

} // namespace

int main() {
    test_coerce_value_accepts_common_spellings();
    test_defaults_and_typed_getters();
    test_set_coerces_and_rejects();
    test_unset_restores_default();
    test_missing_required_lists_every_unset_option();
    test_resolved_follows_schema_order();

    return 0;
}
