#include "routekit/plugin-builder.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace routekit {

PluginBuilder& PluginBuilder::name(std::string_view name) {
  _plugin.metadata.name.assign(name);
  return *this;
}

PluginBuilder& PluginBuilder::version(std::string_view version) {
  _plugin.metadata.version.assign(version);
  return *this;
}

PluginBuilder& PluginBuilder::description(std::string_view description) {
  _plugin.metadata.description.assign(description);
  return *this;
}

PluginBuilder& PluginBuilder::author(std::string_view author) {
  _plugin.metadata.author.assign(author);
  return *this;
}

PluginBuilder& PluginBuilder::dependsOn(std::string_view pluginName) {
  _plugin.metadata.dependencies.emplace_back(pluginName);
  return *this;
}

PluginBuilder& PluginBuilder::tag(std::string_view tag) {
  _plugin.metadata.tags.emplace_back(tag);
  return *this;
}

PluginBuilder& PluginBuilder::config(std::string_view key, std::string_view value) {
  _plugin.config[std::string(key)] = value;
  return *this;
}

PluginBuilder& PluginBuilder::onRegister(PluginHook registerFn) {
  _plugin.registerFn = std::move(registerFn);
  return *this;
}

PluginBuilder& PluginBuilder::beforeRegister(PluginHook hook) {
  _plugin.hooks.beforeRegister = std::move(hook);
  return *this;
}

PluginBuilder& PluginBuilder::afterRegister(PluginHook hook) {
  _plugin.hooks.afterRegister = std::move(hook);
  return *this;
}

PluginBuilder& PluginBuilder::beforeStart(PluginHook hook) {
  _plugin.hooks.beforeStart = std::move(hook);
  return *this;
}

PluginBuilder& PluginBuilder::afterStart(PluginHook hook) {
  _plugin.hooks.afterStart = std::move(hook);
  return *this;
}

PluginBuilder& PluginBuilder::beforeStop(PluginHook hook) {
  _plugin.hooks.beforeStop = std::move(hook);
  return *this;
}

PluginBuilder& PluginBuilder::afterStop(PluginHook hook) {
  _plugin.hooks.afterStop = std::move(hook);
  return *this;
}

Plugin PluginBuilder::build() const {
  if (_plugin.metadata.name.empty()) {
    throw std::invalid_argument("Plugin name is required");
  }
  if (_plugin.metadata.version.empty()) {
    throw std::invalid_argument("Plugin '" + _plugin.metadata.name + "' has no version");
  }
  if (!_plugin.registerFn) {
    throw std::invalid_argument("Plugin '" + _plugin.metadata.name + "' has no register function");
  }
  return _plugin;
}

}  // namespace routekit
