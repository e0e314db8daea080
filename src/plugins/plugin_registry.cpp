#include "plugins/plugin_registry.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>
#include <utility>

#include "core/errors.hpp"
#include "core/path_resolver.hpp"
#include "log/logger.hpp"
#include "plugins/manifest_plugin.hpp"
#include "tools/output_parser.hpp"
#include "tools/tool_catalog.hpp"

namespace penkit {

namespace fs = std::filesystem;

PluginRegistry::PluginRegistry(Logger &logger) : logger_(logger) {}

void PluginRegistry::validate(const Plugin &plugin) {
    const auto &descriptor = plugin.descriptor;

    if (descriptor.name.empty()) {
        throw ContractError("plugin has no name");
    }

    if (!is_safe_path_component(descriptor.name)) {
        throw ContractError("plugin name '" + descriptor.name +
                            "' may only contain letters, digits, '_', '-' and '.'");
    }

    if (descriptor.description.empty()) {
        throw ContractError("plugin '" + descriptor.name + "' has no description");
    }

    if (!plugin.run) {
        throw ContractError("plugin '" + descriptor.name + "' has no run entry point");
    }

    std::set<std::string, std::less<>> seen;
    for (const auto &option : descriptor.options) {
        if (option.name.empty()) {
            throw ContractError("plugin '" + descriptor.name + "' declares an option without a name");
        }

        if (!seen.insert(option.name).second) {
            throw ContractError("plugin '" + descriptor.name + "' declares option '" + option.name + "' twice");
        }

        if (option.default_value.has_value() && type_of(*option.default_value) != option.type) {
            throw ContractError("plugin '" + descriptor.name + "': default of '" + option.name + "' is not a " +
                                std::string(type_name(option.type)));
        }
    }
}

const Plugin &PluginRegistry::register_plugin(Plugin plugin) {
    validate(plugin);

    if (contains(plugin.descriptor.name)) {
        throw DuplicateNameError("plugin '" + plugin.descriptor.name + "' is already registered");
    }

    plugins_.push_back(std::make_unique<Plugin>(std::move(plugin)));
    logger_.debug("registered plugin " + plugins_.back()->descriptor.name);
    return *plugins_.back();
}

const Plugin &PluginRegistry::lookup(std::string_view name) const {
    for (const auto &plugin : plugins_) {
        if (plugin->descriptor.name == name) {
            return *plugin;
        }
    }

    throw NotFoundError("unknown module '" + std::string(name) + "'");
}

bool PluginRegistry::contains(std::string_view name) const {
    return std::any_of(plugins_.begin(), plugins_.end(),
                       [name](const std::unique_ptr<Plugin> &plugin) { return plugin->descriptor.name == name; });
}

std::size_t PluginRegistry::size() const noexcept { return plugins_.size(); }

std::size_t PluginRegistry::load_manifest_file(const std::string &path, ToolCatalog &tools) {
    try {
        auto manifest = load_manifest(path);
        validate(manifest.plugin);

        const auto &name = manifest.plugin.descriptor.name;
        if (contains(name) || tools.contains(name)) {
            throw DuplicateNameError("plugin '" + name + "' is already registered");
        }

        tools.add(std::move(manifest.tool), std::make_unique<RawLinesParser>());
        register_plugin(std::move(manifest.plugin));
        logger_.info("loaded plugin " + name + " from " + path);
        return 1;
    } catch (const PenkitError &error) {
        logger_.warning("skipping plugin manifest " + path + ": " + error.what());
        return 0;
    }
}

std::size_t PluginRegistry::discover(const std::string &directory, ToolCatalog &tools) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        logger_.debug("plugin directory " + directory + " does not exist");
        return 0;
    }

    std::vector<fs::path> manifests;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        const auto &entry = *it;

        if (entry.is_directory(entry_ec)) {
            const auto candidate = entry.path() / "plugin.yaml";
            if (fs::is_regular_file(candidate, entry_ec)) {
                manifests.push_back(candidate);
            }
        } else if (entry.path().extension() == ".yaml" && entry.is_regular_file(entry_ec)) {
            manifests.push_back(entry.path());
        }
    }

    if (ec) {
        logger_.warning("cannot read plugin directory " + directory + ": " + ec.message());
    }

    // Stable registration order.
    std::sort(manifests.begin(), manifests.end());

    std::size_t loaded = 0;
    for (const auto &path : manifests) {
        loaded += load_manifest_file(path.string(), tools);
    }

    return loaded;
}

} // namespace penkit
