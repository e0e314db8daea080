#include "modules/builtin_modules.hpp"

#include "plugins/plugin_registry.hpp"

namespace penkit {

void register_builtin_modules(PluginRegistry &registry) {
    registry.register_plugin(port_scanner_plugin());
    registry.register_plugin(web_scanner_plugin());
}

} // namespace penkit
