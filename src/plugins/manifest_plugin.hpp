#pragma once

#include <string>

#include "plugins/plugin.hpp"
#include "tools/tool_integration.hpp"

namespace penkit {

// A plugin declared in a YAML manifest: one external tool invoked with
// argument templates that reference the module's options as "{name}".
struct ManifestPlugin {
    Plugin plugin;
    // Registered in the tool catalog under the plugin's name.
    ToolDescriptor tool;
};

// Throws ContractError for unreadable or malformed manifests.
[[nodiscard]] ManifestPlugin load_manifest(const std::string &path);

} // namespace penkit
