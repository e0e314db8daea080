#include "tools/tool_catalog.hpp"

#include <utility>

#include "core/errors.hpp"

namespace penkit {

ToolDescriptor nmap_descriptor() {
    return ToolDescriptor{
        .name = "nmap",
        .binary_name = "nmap",
        .version_args = {"--version"},
        .default_args = {},
        .container_image = "instrumentisto/nmap:latest",
        .container_options = {"--net=host"},
        .mode = ExecutionMode::Auto,
    };
}

ToolDescriptor sqlmap_descriptor() {
    return ToolDescriptor{
        .name = "sqlmap",
        .binary_name = "sqlmap",
        .version_args = {"--version"},
        .default_args = {"--batch"},
        .container_image = "vulnerables/sqlmap-python3",
        .container_options = {},
        .mode = ExecutionMode::Auto,
    };
}

ToolCatalog::ToolCatalog(const ConfigStore &config, const PathResolver &path_resolver, Logger &logger)
    : config_(config), path_resolver_(path_resolver), logger_(logger) {}

void ToolCatalog::add_builtin_tools() {
    add(nmap_descriptor(), std::make_unique<NmapGrepableParser>());
    add(sqlmap_descriptor(), std::make_unique<SqlmapTextParser>());
}

ToolIntegration &ToolCatalog::add(ToolDescriptor descriptor, std::unique_ptr<OutputParser> parser) {
    if (contains(descriptor.name)) {
        throw DuplicateNameError("tool '" + descriptor.name + "' is already registered");
    }

    tools_.push_back(
        std::make_unique<ToolIntegration>(std::move(descriptor), std::move(parser), config_, path_resolver_, logger_));
    return *tools_.back();
}

bool ToolCatalog::contains(std::string_view name) const {
    for (const auto &tool : tools_) {
        if (tool->descriptor().name == name) {
            return true;
        }
    }

    return false;
}

const ToolIntegration &ToolCatalog::get(std::string_view name) const {
    for (const auto &tool : tools_) {
        if (tool->descriptor().name == name) {
            return *tool;
        }
    }

    throw ToolNotFoundError("no integration registered for tool '" + std::string(name) + "'");
}

std::vector<const ToolIntegration *> ToolCatalog::list() const {
    std::vector<const ToolIntegration *> result;
    result.reserve(tools_.size());

    for (const auto &tool : tools_) {
        result.push_back(tool.get());
    }

    return result;
}

} // namespace penkit
