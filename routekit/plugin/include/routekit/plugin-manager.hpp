#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "routekit/plugin-context.hpp"
#include "routekit/plugin-status.hpp"
#include "routekit/plugin.hpp"
#include "routekit/service-registry.hpp"
#include "routekit/vector.hpp"

namespace routekit {

class Router;
class MiddlewarePipeline;

// Registers plugins against a Router and a MiddlewarePipeline and drives their lifecycle.
//
// Lifecycle of the manager:
//  - setup phase: plugins are registered, in dependency order
//  - startPlugins(): beforeStart hooks of all plugins, then afterStart hooks, in registration order.
//    The service registry is frozen.
//  - stopPlugins(): beforeStop hooks of all plugins, then afterStop hooks, in reverse registration order.
// The manager is single-shot: it cannot be started again once stopped.
// None of these methods is thread safe, they are meant to be called during application setup and teardown.
class PluginManager {
 public:
  PluginManager(Router& router, MiddlewarePipeline& pipeline);

  PluginManager(const PluginManager&) = delete;
  PluginManager(PluginManager&&) noexcept = delete;
  PluginManager& operator=(const PluginManager&) = delete;
  PluginManager& operator=(PluginManager&&) noexcept = delete;

  ~PluginManager();

  // Registers given plugin and calls its register function.
  // Throws:
  //  - DuplicatePluginError if a plugin with the same name is already registered
  //  - MissingDependencyError if one of its dependencies is not registered yet
  //  - std::logic_error if plugins are already started
  //  - any exception thrown by the beforeRegister hook, the register function or the afterRegister hook. In this
  //    case the plugin is forgotten (it can be registered again), but routes, middlewares and services it added
  //    before the failure are kept.
  void registerPlugin(Plugin plugin, PluginRegistrationOptions options = {});

  // Throws std::logic_error if already started (or stopped), LifecycleHookError if a hook throws (whatever the type
  // of the thrown object, it is available as the nested exception). A failed start
  // leaves all plugins in registered state, it may be retried.
  void startPlugins();

  // No-op if plugins are not started. Throws LifecycleHookError if a hook throws, the remaining hooks are not called.
  void stopPlugins();

  [[nodiscard]] bool hasPlugin(std::string_view name) const noexcept { return findRecord(name) != nullptr; }

  // Returns PluginStatus::Unregistered for unknown plugins.
  [[nodiscard]] PluginStatus status(std::string_view name) const noexcept;

  // Returns nullptr for unknown plugins.
  [[nodiscard]] const PluginMetadata* metadata(std::string_view name) const noexcept;

  // Names of registered plugins, in registration order.
  [[nodiscard]] vector<std::string> pluginNames() const;

  [[nodiscard]] std::size_t size() const noexcept { return _plugins.size(); }

  [[nodiscard]] bool isStarted() const noexcept { return _phase == Phase::Started; }

  // Looks up a service by its qualified name ('<plugin>:<service>'). Returns nullptr if not found.
  template <class T>
  [[nodiscard]] std::shared_ptr<T> getService(std::string_view qualifiedName) const {
    return _services.find<T>(qualifiedName);
  }

  [[nodiscard]] const ServiceRegistry& services() const noexcept { return _services; }

 private:
  enum class Phase : std::uint8_t { Setup, Started, Stopped };

  struct PluginRecord {
    Plugin plugin;
    std::unique_ptr<PluginContext> context;
    PluginStatus status{PluginStatus::Unregistered};
  };

  [[nodiscard]] const PluginRecord* findRecord(std::string_view name) const noexcept;

  // Forgets the plugin but keeps its context alive.
  void retireRecord(std::string_view name);

  Router& _router;
  MiddlewarePipeline& _pipeline;
  ServiceRegistry _services;
  vector<std::unique_ptr<PluginRecord>> _plugins;  // registration order
  vector<std::unique_ptr<PluginContext>> _retiredContexts;  // contexts of plugins whose registration failed
  Phase _phase{Phase::Setup};
};

}  // namespace routekit
