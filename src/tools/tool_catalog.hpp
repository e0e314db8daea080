#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tools/tool_integration.hpp"

namespace penkit {

class ConfigStore;
class Logger;
class PathResolver;

[[nodiscard]] ToolDescriptor nmap_descriptor();
[[nodiscard]] ToolDescriptor sqlmap_descriptor();

class ToolCatalog {
  public:
    ToolCatalog(const ConfigStore &config, const PathResolver &path_resolver, Logger &logger);

    // Registers nmap and sqlmap.
    void add_builtin_tools();

    // Throws DuplicateNameError if the tool name is taken.
    ToolIntegration &add(ToolDescriptor descriptor, std::unique_ptr<OutputParser> parser);

    [[nodiscard]] bool contains(std::string_view name) const;
    // Throws ToolNotFoundError for unknown names.
    [[nodiscard]] const ToolIntegration &get(std::string_view name) const;
    [[nodiscard]] std::vector<const ToolIntegration *> list() const;

  private:
    const ConfigStore &config_;
    const PathResolver &path_resolver_;
    Logger &logger_;
    std::vector<std::unique_ptr<ToolIntegration>> tools_;
};

} // namespace penkit
