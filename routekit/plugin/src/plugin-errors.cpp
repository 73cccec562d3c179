#include "routekit/plugin-errors.hpp"

#include <string>
#include <string_view>

namespace routekit {

PluginError::PluginError(std::string_view pluginName, const std::string& message)
    : std::runtime_error(message), _pluginName(pluginName) {}

DuplicatePluginError::DuplicatePluginError(std::string_view pluginName)
    : PluginError(pluginName, "Plugin '" + std::string(pluginName) + "' is already registered") {}

MissingDependencyError::MissingDependencyError(std::string_view pluginName, std::string_view dependency)
    : PluginError(pluginName, "Plugin '" + std::string(pluginName) + "' depends on '" + std::string(dependency) +
                                  "' which is not registered"),
      _dependency(dependency) {}

LifecycleHookError::LifecycleHookError(std::string_view pluginName, std::string_view hookName)
    : PluginError(pluginName,
                  "Plugin '" + std::string(pluginName) + "' failed in hook '" + std::string(hookName) + "'"),
      _hookName(hookName) {}

}  // namespace routekit
