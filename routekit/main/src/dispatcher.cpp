#include "routekit/dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-constants.hpp"
#include "routekit/http-status-code.hpp"
#include "routekit/log.hpp"
#include "routekit/path-params.hpp"

namespace routekit {

namespace {

DispatcherConfig Validated(DispatcherConfig config) {
  config.validate();
  return config;
}

HttpResponse MakeNotFoundResponse() {
  return {http::StatusCodeNotFound, std::string(http::ReasonNotFound), http::ContentTypeTextPlain};
}

HttpResponse MakeInternalErrorResponse() {
  return {http::StatusCodeInternalServerError, std::string(http::ReasonInternalServerError),
          http::ContentTypeTextPlain};
}

}  // namespace

Dispatcher::Dispatcher(DispatcherConfig config)
    : _config(Validated(std::move(config))),
      _router(_config.routerConfig),
      _routeCache(_config.enableRouteCache ? _config.routeCacheCapacity : 0),
      _plugins(_router, _pipeline) {
  // Covers routes added directly, through mount() and by plugins.
  _router.setRouteAddedCallback([this](const Route& route) { warnIfDispatchStarted(route.pattern()); });
}

Dispatcher::~Dispatcher() = default;

Route& Dispatcher::addRoute(http::Method method, std::string_view pattern, RequestHandler handler,
                            vector<Middleware> middlewares) {
  return _router.addRoute(method, pattern, std::move(handler), std::move(middlewares));
}

void Dispatcher::use(Middleware middleware) { _pipeline.use(std::move(middleware)); }

void Dispatcher::use(std::string_view scopePath, Middleware middleware) {
  _pipeline.use(scopePath, std::move(middleware));
}

void Dispatcher::mount(std::string_view basePath, const Router& router) {
  _router.mount(basePath, router);
}

void Dispatcher::registerPlugin(Plugin plugin, PluginRegistrationOptions options) {
  _plugins.registerPlugin(std::move(plugin), std::move(options));
}

void Dispatcher::startPlugins() { _plugins.startPlugins(); }

void Dispatcher::stopPlugins() { _plugins.stopPlugins(); }

HttpResponse Dispatcher::dispatch(HttpRequest& request) {
  _dispatchStarted.store(true, std::memory_order_relaxed);

  DispatchMetrics metrics;
  metrics.method = request.method();
  metrics.path = request.path();

  HttpResponse response = resolveAndRun(request, metrics);

  if (_metricsCallback) {
    metrics.status = response.status();
    metrics.duration = std::chrono::steady_clock::now() - request.reqStart();
    _metricsCallback(metrics);
  }
  return response;
}

HttpResponse Dispatcher::resolveAndRun(HttpRequest& request, DispatchMetrics& metrics) {
  const Route* route = nullptr;
  PathParams params;

  std::string cacheKey;
  if (_config.enableRouteCache) {
    cacheKey = MakeCacheKey(request.method(), request.path());
    auto entry = _routeCache.get(cacheKey);
    if (entry) {
      route = entry->route;
      params = std::move(entry->params);
      metrics.cacheHit = true;
    }
  }

  if (route == nullptr) {
    RoutingResult result = _router.match(request.method(), request.path());
    if (!result.hasHandler()) {
      log::debug("No route for {} {}", http::MethodToStr(request.method()), request.path());
      return MakeNotFoundResponse();
    }
    route = result.route;
    params = std::move(result.params);
    if (_config.enableRouteCache) {
      _routeCache.set(cacheKey, route, params);
    }
  }

  metrics.matched = true;
  request.setPathParams(std::move(params));

  try {
    return _pipeline.run(request, *route);
  } catch (const std::exception& ex) {
    log::error("Unhandled exception while dispatching {} {}: {}", http::MethodToStr(request.method()),
               request.path(), ex.what());
  } catch (...) {
    log::error("Unhandled unknown exception while dispatching {} {}", http::MethodToStr(request.method()),
               request.path());
  }
  metrics.threw = true;
  return MakeInternalErrorResponse();
}

void Dispatcher::logRoutes() const {
  const auto routeInfos = _router.routes();
  log::info("{} route(s) registered", routeInfos.size());
  for (const RouteInfo& info : routeInfos) {
    log::info("  {:<7} {}", http::MethodToStr(info.method), info.pattern);
  }
}

void Dispatcher::warnIfDispatchStarted(std::string_view what) const {
  if (_dispatchStarted.load(std::memory_order_relaxed)) {
    log::warn("Route registration of '{}' after the first dispatch, previously cached matches are not invalidated",
              what);
  }
}

}  // namespace routekit
