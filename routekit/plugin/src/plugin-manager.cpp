#include "routekit/plugin-manager.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/log.hpp"
#include "routekit/middleware-pipeline.hpp"
#include "routekit/plugin-errors.hpp"
#include "routekit/router.hpp"

namespace routekit {

namespace {

void RunLifecycleHook(const PluginHook& hook, PluginContext& context, std::string_view hookName) {
  if (!hook) {
    return;
  }
  try {
    hook(context);
  } catch (const std::exception& ex) {
    log::error("Plugin '{}' failed in hook '{}': {}", context.name(), hookName, ex.what());
    std::throw_with_nested(LifecycleHookError(context.name(), hookName));
  } catch (...) {
    log::error("Plugin '{}' failed in hook '{}': unknown exception", context.name(), hookName);
    std::throw_with_nested(LifecycleHookError(context.name(), hookName));
  }
}

}  // namespace

PluginManager::PluginManager(Router& router, MiddlewarePipeline& pipeline) : _router(router), _pipeline(pipeline) {}

PluginManager::~PluginManager() = default;

void PluginManager::registerPlugin(Plugin plugin, PluginRegistrationOptions options) {
  if (_phase != Phase::Setup) {
    throw std::logic_error("Cannot register plugin '" + plugin.metadata.name + "' after plugins have been started");
  }
  const std::string& name = plugin.metadata.name;
  if (name.empty()) {
    throw std::invalid_argument("Plugin name cannot be empty");
  }
  if (!plugin.registerFn) {
    throw std::invalid_argument("Plugin '" + name + "' has no register function");
  }
  if (hasPlugin(name)) {
    throw DuplicatePluginError(name);
  }
  for (const std::string& dependency : plugin.metadata.dependencies) {
    if (status(dependency) < PluginStatus::Registered) {
      throw MissingDependencyError(name, dependency);
    }
  }

  PluginConfig effectiveConfig = plugin.config;
  for (auto& [key, value] : options.config) {
    effectiveConfig[key] = std::move(value);
  }

  auto record = std::make_unique<PluginRecord>();
  record->context = std::make_unique<PluginContext>(plugin.metadata, std::move(effectiveConfig), options.prefix,
                                                    _router, _pipeline, _services);
  record->plugin = std::move(plugin);
  record->status = PluginStatus::Registering;

  PluginRecord& rec = *record;
  _plugins.push_back(std::move(record));

  const std::string pluginName = rec.plugin.metadata.name;
  try {
    if (rec.plugin.hooks.beforeRegister) {
      rec.plugin.hooks.beforeRegister(*rec.context);
    }
    rec.plugin.registerFn(*rec.context);
    rec.status = PluginStatus::Registered;
    if (rec.plugin.hooks.afterRegister) {
      rec.plugin.hooks.afterRegister(*rec.context);
    }
  } catch (const std::exception& ex) {
    log::error("Registration of plugin '{}' failed: {}", pluginName, ex.what());
    retireRecord(pluginName);
    throw;
  } catch (...) {
    log::error("Registration of plugin '{}' failed: unknown exception", pluginName);
    retireRecord(pluginName);
    throw;
  }

  log::info("Plugin '{}' v{} registered", pluginName, rec.plugin.metadata.version);
}

void PluginManager::startPlugins() {
  if (_phase != Phase::Setup) {
    throw std::logic_error("Plugins have already been started");
  }
  try {
    for (auto& record : _plugins) {
      record->status = PluginStatus::Starting;
      RunLifecycleHook(record->plugin.hooks.beforeStart, *record->context, "beforeStart");
    }
    for (auto& record : _plugins) {
      RunLifecycleHook(record->plugin.hooks.afterStart, *record->context, "afterStart");
      record->status = PluginStatus::Started;
    }
  } catch (...) {
    for (auto& record : _plugins) {
      record->status = PluginStatus::Registered;
    }
    throw;
  }
  _services.freeze();
  _phase = Phase::Started;
  log::info("{} plugin(s) started", _plugins.size());
}

void PluginManager::stopPlugins() {
  if (_phase != Phase::Started) {
    return;
  }
  _phase = Phase::Stopped;
  for (std::size_t pos = _plugins.size(); pos > 0; --pos) {
    PluginRecord& record = *_plugins[pos - 1U];
    record.status = PluginStatus::Stopping;
    RunLifecycleHook(record.plugin.hooks.beforeStop, *record.context, "beforeStop");
  }
  for (std::size_t pos = _plugins.size(); pos > 0; --pos) {
    PluginRecord& record = *_plugins[pos - 1U];
    RunLifecycleHook(record.plugin.hooks.afterStop, *record.context, "afterStop");
    record.status = PluginStatus::Stopped;
  }
  log::info("{} plugin(s) stopped", _plugins.size());
}

PluginStatus PluginManager::status(std::string_view name) const noexcept {
  const PluginRecord* record = findRecord(name);
  return record == nullptr ? PluginStatus::Unregistered : record->status;
}

const PluginMetadata* PluginManager::metadata(std::string_view name) const noexcept {
  const PluginRecord* record = findRecord(name);
  return record == nullptr ? nullptr : &record->plugin.metadata;
}

vector<std::string> PluginManager::pluginNames() const {
  vector<std::string> names;
  names.reserve(_plugins.size());
  for (const auto& record : _plugins) {
    names.push_back(record->plugin.metadata.name);
  }
  return names;
}

const PluginManager::PluginRecord* PluginManager::findRecord(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(
      _plugins, [name](const std::unique_ptr<PluginRecord>& record) { return record->plugin.metadata.name == name; });
  return it == _plugins.end() ? nullptr : it->get();
}

void PluginManager::retireRecord(std::string_view name) {
  const auto it = std::ranges::find_if(
      _plugins, [name](const std::unique_ptr<PluginRecord>& record) { return record->plugin.metadata.name == name; });
  if (it != _plugins.end()) {
    // Routes and middlewares added before the failure may reference the context, it has to outlive them.
    _retiredContexts.push_back(std::move((*it)->context));
    _plugins.erase(it);
  }
}

}  // namespace routekit
