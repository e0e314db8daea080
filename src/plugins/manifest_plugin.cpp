#include "plugins/manifest_plugin.hpp"

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "config/config_store.hpp"
#include "core/errors.hpp"
#include "core/path_resolver.hpp"
#include "log/logger.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

namespace {

[[nodiscard]] std::string read_string(const YAML::Node &node, const char *key, const std::string &path,
                                      bool required) {
    const YAML::Node field = node[key];

    if (!field || field.IsNull()) {
        if (required) {
            throw ContractError(path + ": missing '" + key + "'");
        }
        return {};
    }

    if (!field.IsScalar()) {
        throw ContractError(path + ": '" + key + "' must be a string");
    }

    return field.Scalar();
}

[[nodiscard]] std::vector<std::string> read_list(const YAML::Node &node, const char *key, const std::string &path) {
    const YAML::Node field = node[key];
    std::vector<std::string> values;

    if (!field || field.IsNull()) {
        return values;
    }

    if (!field.IsSequence()) {
        throw ContractError(path + ": '" + key + "' must be a list");
    }

    for (const auto &item : field) {
        if (!item.IsScalar()) {
            throw ContractError(path + ": entries of '" + key + "' must be strings");
        }
        values.push_back(item.Scalar());
    }

    return values;
}

[[nodiscard]] OptionSpec read_option(const YAML::Node &node, const std::string &path) {
    if (!node.IsMap()) {
        throw ContractError(path + ": each option must be a mapping");
    }

    OptionSpec spec;
    spec.name = read_string(node, "name", path, true);
    spec.description = read_string(node, "description", path, false);

    const auto type_text = read_string(node, "type", path, false);
    if (!type_text.empty()) {
        const auto type = type_from_name(type_text);
        if (!type.has_value()) {
            throw ContractError(path + ": option '" + spec.name + "' has unknown type '" + type_text + "'");
        }
        spec.type = *type;
    }

    if (const YAML::Node required = node["required"]) {
        auto flag = coerce_value(ValueType::Bool, required.Scalar());
        if (!flag.has_value()) {
            throw ContractError(path + ": option '" + spec.name + "': " + flag.error());
        }
        spec.required = std::get<bool>(*flag);
    }

    if (const YAML::Node fallback = node["default"]; fallback && !fallback.IsNull()) {
        if (!fallback.IsScalar()) {
            throw ContractError(path + ": default of option '" + spec.name + "' must be a scalar");
        }

        auto value = coerce_value(spec.type, fallback.Scalar());
        if (!value.has_value()) {
            throw ContractError(path + ": option '" + spec.name + "': " + value.error());
        }
        spec.default_value = std::move(*value);
    }

    return spec;
}

[[nodiscard]] RunFunction make_runner(std::string tool_name, std::vector<std::string> arg_templates,
                                      std::int64_t timeout_seconds) {
    return [tool_name = std::move(tool_name), arg_templates = std::move(arg_templates),
            timeout_seconds](const OptionSet &options, ModuleContext &context) {
        const auto &tool = context.tools.get(tool_name);

        std::vector<std::string> args;
        for (const auto &arg_template : arg_templates) {
            auto arg = substitute_options(arg_template, options);
            // A template that only named an unset option disappears instead of passing "".
            if (arg.empty() && !arg_template.empty()) {
                continue;
            }
            args.push_back(std::move(arg));
        }

        const auto timeout =
            checked_timeout(timeout_seconds > 0 ? timeout_seconds : context.config.get_int("tools.default_timeout"));
        context.logger.debug("running manifest tool " + tool_name);

        try {
            return report_from_tool(tool.execute(args, timeout));
        } catch (const ExecutionTimeoutError &error) {
            return report_from_timeout(error);
        }
    };
}

} // namespace

ManifestPlugin load_manifest(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &error) {
        throw ContractError(path + ": " + error.what());
    }

    if (!root.IsMap()) {
        throw ContractError(path + ": manifest must be a mapping");
    }

    ManifestPlugin manifest;
    auto &descriptor = manifest.plugin.descriptor;

    descriptor.name = read_string(root, "name", path, true);
    if (!is_safe_path_component(descriptor.name)) {
        throw ContractError(path + ": plugin name '" + descriptor.name +
                            "' may only contain letters, digits, '_', '-' and '.'");
    }
    descriptor.description = read_string(root, "description", path, true);
    if (auto version = read_string(root, "version", path, false); !version.empty()) {
        descriptor.version = std::move(version);
    }
    descriptor.author = read_string(root, "author", path, false);

    if (const YAML::Node options = root["options"]; options && !options.IsNull()) {
        if (!options.IsSequence()) {
            throw ContractError(path + ": 'options' must be a list");
        }
        for (const auto &option : options) {
            descriptor.options.push_back(read_option(option, path));
        }
    }

    const YAML::Node tool = root["tool"];
    if (!tool || !tool.IsMap()) {
        throw ContractError(path + ": missing 'tool' section");
    }

    auto &descriptor_tool = manifest.tool;
    descriptor_tool.name = descriptor.name;
    descriptor_tool.binary_name = read_string(tool, "binary", path, true);
    if (tool["version_args"]) {
        descriptor_tool.version_args = read_list(tool, "version_args", path);
    }
    descriptor_tool.default_args = read_list(tool, "default_args", path);
    descriptor_tool.container_image = read_string(tool, "container_image", path, false);
    descriptor_tool.container_options = read_list(tool, "container_options", path);

    if (const auto mode_text = read_string(tool, "mode", path, false); !mode_text.empty()) {
        const auto mode = mode_from_name(mode_text);
        if (!mode.has_value()) {
            throw ContractError(path + ": unknown tool mode '" + mode_text + "'");
        }
        descriptor_tool.mode = *mode;
    }

    std::int64_t timeout_seconds = 0;
    if (const YAML::Node timeout = root["timeout"]; timeout && !timeout.IsNull()) {
        auto value = coerce_value(ValueType::Int, timeout.Scalar());
        if (!value.has_value() || !is_valid_timeout(std::get<std::int64_t>(*value))) {
            throw ContractError(path + ": 'timeout' must be between 1 and " +
                                std::to_string(max_tool_timeout.count()) + " seconds");
        }
        timeout_seconds = std::get<std::int64_t>(*value);
    }

    manifest.plugin.run = make_runner(descriptor.name, read_list(tool, "args", path), timeout_seconds);
    return manifest;
}

} // namespace penkit
