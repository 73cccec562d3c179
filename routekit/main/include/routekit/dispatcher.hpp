#pragma once

#include <atomic>
#include <functional>
#include <string_view>
#include <utility>

#include "routekit/dispatch-metrics.hpp"
#include "routekit/dispatcher-config.hpp"
#include "routekit/http-method.hpp"
#include "routekit/http-request.hpp"
#include "routekit/http-response.hpp"
#include "routekit/middleware-pipeline.hpp"
#include "routekit/middleware.hpp"
#include "routekit/plugin-manager.hpp"
#include "routekit/plugin.hpp"
#include "routekit/route-group.hpp"
#include "routekit/route-match-cache.hpp"
#include "routekit/router.hpp"
#include "routekit/vector.hpp"

namespace routekit {

// Entry point of the framework: owns the route table, the middleware pipeline, the route match cache and the plugin
// manager, and turns an HttpRequest into an HttpResponse.
//
// Typical usage:
//   Dispatcher dispatcher;
//   dispatcher.use(MakeErrorHandlerMiddleware());
//   dispatcher.get("/users/:id", [](HttpRequest& req, ResponseBuilder& res) {
//     res.json(User{std::string(req.pathParamValue("id").value_or(""))});
//   });
//   dispatcher.startPlugins();
//   HttpResponse resp = dispatcher.dispatch(request);
//
// Registration (routes, middlewares, plugins) is expected to happen before the first dispatch and is not thread
// safe. Once traffic has begun, dispatch() may be called concurrently.
class Dispatcher {
 public:
  using MetricsCallback = std::function<void(const DispatchMetrics&)>;

  // Throws std::invalid_argument if config is invalid.
  explicit Dispatcher(DispatcherConfig config = {});

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) noexcept = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher& operator=(Dispatcher&&) noexcept = delete;

  ~Dispatcher();

  Route& addRoute(http::Method method, std::string_view pattern, RequestHandler handler,
                  vector<Middleware> middlewares = {});

  Route& get(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::GET, pattern, std::move(handler), std::move(middlewares));
  }

  Route& post(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::POST, pattern, std::move(handler), std::move(middlewares));
  }

  Route& put(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::PUT, pattern, std::move(handler), std::move(middlewares));
  }

  Route& del(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::DELETE, pattern, std::move(handler), std::move(middlewares));
  }

  Route& patch(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::PATCH, pattern, std::move(handler), std::move(middlewares));
  }

  Route& head(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::HEAD, pattern, std::move(handler), std::move(middlewares));
  }

  Route& options(std::string_view pattern, RequestHandler handler, vector<Middleware> middlewares = {}) {
    return addRoute(http::Method::OPTIONS, pattern, std::move(handler), std::move(middlewares));
  }

  // Routes registered through the returned group get the prefix and the group middlewares (see RouteGroup).
  // The group must not outlive the Dispatcher.
  [[nodiscard]] RouteGroup group(std::string_view prefix, vector<Middleware> middlewares = {}) {
    return {_router, prefix, std::move(middlewares)};
  }

  // Adds a global middleware.
  void use(Middleware middleware);

  // Adds a middleware for paths at or below scopePath.
  void use(std::string_view scopePath, Middleware middleware);

  // Copies all routes of given router under basePath.
  void mount(std::string_view basePath, const Router& router);

  // See PluginManager::registerPlugin.
  void registerPlugin(Plugin plugin, PluginRegistrationOptions options = {});

  void startPlugins();

  void stopPlugins();

  [[nodiscard]] PluginManager& plugins() noexcept { return _plugins; }

  [[nodiscard]] const PluginManager& plugins() const noexcept { return _plugins; }

  // Resolves the route of given request and runs the middleware chain.
  //  - no matching route: 404 'Not Found' (text/plain), no middleware is run
  //  - an exception escaping the chain: it is logged and converted to a generic 500 'Internal Server Error'
  //    (text/plain), without any detail of the exception.
  // The path params of the request are set before the chain runs.
  [[nodiscard]] HttpResponse dispatch(HttpRequest& request);

  // Called after each dispatch, from the dispatching thread. Pass an empty function to remove it.
  void setMetricsCallback(MetricsCallback callback) { _metricsCallback = std::move(callback); }

  [[nodiscard]] CacheStats cacheStats() const { return _routeCache.stats(); }

  void clearRouteCache() { _routeCache.clear(); }

  [[nodiscard]] vector<RouteInfo> routes() const { return _router.routes(); }

  // Logs the route table at info level.
  void logRoutes() const;

  [[nodiscard]] const Router& router() const noexcept { return _router; }

  [[nodiscard]] const DispatcherConfig& config() const noexcept { return _config; }

 private:
  HttpResponse resolveAndRun(HttpRequest& request, DispatchMetrics& metrics);

  void warnIfDispatchStarted(std::string_view what) const;

  DispatcherConfig _config;
  Router _router;
  MiddlewarePipeline _pipeline;
  RouteMatchCache _routeCache;
  PluginManager _plugins;
  MetricsCallback _metricsCallback;
  std::atomic<bool> _dispatchStarted{false};
};

}  // namespace routekit
