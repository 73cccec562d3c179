#pragma once

#include <string>
#include <string_view>

#include "routekit/plugin.hpp"

namespace routekit {

// Fluent construction of a Plugin.
//
//   Plugin plugin = PluginBuilder()
//                       .name("auth")
//                       .version("1.0.0")
//                       .config("realm", "api")
//                       .onRegister([](PluginContext& ctx) { ... })
//                       .build();
class PluginBuilder {
 public:
  PluginBuilder& name(std::string_view name);

  PluginBuilder& version(std::string_view version);

  PluginBuilder& description(std::string_view description);

  PluginBuilder& author(std::string_view author);

  PluginBuilder& dependsOn(std::string_view pluginName);

  PluginBuilder& tag(std::string_view tag);

  // Sets a default configuration entry.
  PluginBuilder& config(std::string_view key, std::string_view value);

  PluginBuilder& onRegister(PluginHook registerFn);

  PluginBuilder& beforeRegister(PluginHook hook);
  PluginBuilder& afterRegister(PluginHook hook);
  PluginBuilder& beforeStart(PluginHook hook);
  PluginBuilder& afterStart(PluginHook hook);
  PluginBuilder& beforeStop(PluginHook hook);
  PluginBuilder& afterStop(PluginHook hook);

  // Throws std::invalid_argument if name, version or register function is missing.
  [[nodiscard]] Plugin build() const;

 private:
  Plugin _plugin;
};

}  // namespace routekit
