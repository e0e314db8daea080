#pragma once

#include <cstddef>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

#include "plugins/plugin.hpp"

namespace penkit {

class Logger;
class ToolCatalog;

class PluginRegistry {
  public:
    explicit PluginRegistry(Logger &logger);

    // Throws ContractError for incomplete descriptors and DuplicateNameError when the
    // name is already registered. The registry is unchanged when either is thrown.
    const Plugin &register_plugin(Plugin plugin);

    // Throws NotFoundError.
    [[nodiscard]] const Plugin &lookup(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const noexcept;

    // Descriptors in registration order; the view can be iterated again.
    [[nodiscard]] auto list() const {
        return plugins_ | std::views::transform([](const std::unique_ptr<Plugin> &plugin) -> const PluginDescriptor & {
                   return plugin->descriptor;
               });
    }

    // Loads "<dir>/<name>/plugin.yaml" and "<dir>/<name>.yaml" manifests, registering their
    // tools in the catalog. Broken manifests are logged and skipped. Returns the number loaded.
    std::size_t discover(const std::string &directory, ToolCatalog &tools);

  private:
    Logger &logger_;
    std::vector<std::unique_ptr<Plugin>> plugins_;

    static void validate(const Plugin &plugin);
    std::size_t load_manifest_file(const std::string &path, ToolCatalog &tools);
};

} // namespace penkit
