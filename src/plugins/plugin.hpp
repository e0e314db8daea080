#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "plugins/option_set.hpp"
#include "tools/tool_integration.hpp"

namespace penkit {

class ConfigStore;
class ExecutionTimeoutError;
class Logger;
class ToolCatalog;

struct PluginDescriptor {
    std::string name;
    std::string description;
    std::string version{"1.0"};
    std::string author;
    OptionSchema options;
};

// What a module may touch while it runs.
struct ModuleContext {
    const ConfigStore &config;
    const ToolCatalog &tools;
    Logger &logger;
};

struct ModuleReport {
    // Must carry a "result" key.
    YAML::Node payload;
    bool success{true};
    std::string error;
    // Set when an external process ran, including partial output after a timeout.
    std::optional<ToolOutput> tool;
};

using RunFunction = std::function<ModuleReport(const OptionSet &options, ModuleContext &context)>;

struct Plugin {
    PluginDescriptor descriptor;
    RunFunction run;
};

// A selected module: the registered plugin plus this selection's option values.
class ModuleInstance {
  public:
    explicit ModuleInstance(const Plugin &plugin);

    [[nodiscard]] const std::string &name() const noexcept;
    [[nodiscard]] const Plugin &plugin() const noexcept;
    [[nodiscard]] OptionSet &options() noexcept;
    [[nodiscard]] const OptionSet &options() const noexcept;

    [[nodiscard]] ModuleReport run(ModuleContext &context) const;

  private:
    const Plugin *plugin_;
    OptionSet options_;
};

// Replaces every "{option}" in the template with the option's current value.
// Unknown placeholders are left untouched.
[[nodiscard]] std::string substitute_options(std::string_view text, const OptionSet &options);

[[nodiscard]] bool is_valid_timeout(std::int64_t seconds) noexcept;

// Throws InvalidOptionError unless 1 <= seconds <= max_tool_timeout.
[[nodiscard]] std::chrono::seconds checked_timeout(std::int64_t seconds);

// Report for a tool run: success follows the exit code and whether the output parsed.
[[nodiscard]] ModuleReport report_from_tool(ToolOutput output);

// Failed report that keeps the output captured before the tool was killed.
[[nodiscard]] ModuleReport report_from_timeout(const ExecutionTimeoutError &error);

} // namespace penkit
