#pragma once

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/flat-hash-map.hpp"
#include "routekit/http-method.hpp"
#include "routekit/middleware.hpp"
#include "routekit/plugin.hpp"
#include "routekit/service-registry.hpp"
#include "routekit/vector.hpp"

namespace routekit {

class Route;
class Router;
class MiddlewarePipeline;

// View given to a plugin's register function and hooks.
// Routes and scoped middlewares are prefixed with the registration prefix, services are namespaced with the plugin
// name. The context lives as long as the PluginManager that created it.
class PluginContext {
 public:
  using Storage = flat_hash_map<std::string, std::any>;

  PluginContext(PluginMetadata metadata, PluginConfig config, std::string_view prefix, Router& router,
                MiddlewarePipeline& pipeline, ServiceRegistry& services);

  PluginContext(const PluginContext&) = delete;
  PluginContext(PluginContext&&) noexcept = delete;
  PluginContext& operator=(const PluginContext&) = delete;
  PluginContext& operator=(PluginContext&&) noexcept = delete;

  ~PluginContext() = default;

  [[nodiscard]] const PluginMetadata& metadata() const noexcept { return _metadata; }

  [[nodiscard]] std::string_view name() const noexcept { return _metadata.name; }

  // Effective configuration (plugin defaults overridden by registration options).
  [[nodiscard]] const PluginConfig& config() const noexcept { return _config; }

  [[nodiscard]] std::optional<std::string_view> configValue(const std::string& key) const;

  // Normalized prefix ('' when the plugin was registered without prefix, '/api' otherwise).
  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

  // Private key/value storage, shared between the register function and the hooks of this plugin.
  [[nodiscard]] Storage& storage() noexcept { return _storage; }

  [[nodiscard]] const Storage& storage() const noexcept { return _storage; }

  // Logs given message at info level, prefixed with the plugin name.
  void log(std::string_view message) const;

  // Registers a route at prefix + path.
  Route& addRoute(http::Method method, std::string_view path, RequestHandler handler,
                  vector<Middleware> middlewares = {});

  Route& get(std::string_view path, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::GET, path, std::move(handler), std::move(middlewares));
  }

  Route& post(std::string_view path, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::POST, path, std::move(handler), std::move(middlewares));
  }

  // Adds a global middleware (not prefixed).
  void addMiddleware(Middleware middleware);

  // Adds a middleware scoped to prefix + scopePath.
  void addMiddleware(std::string_view scopePath, Middleware middleware);

  // Registers a service under '<plugin>:<name>'.
  // Throws std::logic_error if the name is already taken or if plugins are already started.
  template <class T>
  void registerService(std::string_view name, std::shared_ptr<T> service) {
    _services.add(qualify(name), std::move(service));
  }

  // Looks up a service.
  // A qualified name ('auth:tokens') is looked up as is, a bare name ('tokens') only resolves to this plugin's own
  // services. Returns nullptr when not found.
  template <class T>
  [[nodiscard]] std::shared_ptr<T> getService(std::string_view name) const {
    if (name.find(':') != std::string_view::npos) {
      return _services.find<T>(name);
    }
    return _services.find<T>(qualify(name));
  }

 private:
  [[nodiscard]] std::string qualify(std::string_view name) const;

  PluginMetadata _metadata;
  PluginConfig _config;
  std::string _prefix;
  Storage _storage;
  Router& _router;
  MiddlewarePipeline& _pipeline;
  ServiceRegistry& _services;
};

}  // namespace routekit
