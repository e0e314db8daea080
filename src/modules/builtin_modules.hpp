#pragma once

#include "plugins/plugin.hpp"

namespace penkit {

class PluginRegistry;

[[nodiscard]] Plugin port_scanner_plugin();
[[nodiscard]] Plugin web_scanner_plugin();

// Registers every module that ships with the binary.
void register_builtin_modules(PluginRegistry &registry);

} // namespace penkit
