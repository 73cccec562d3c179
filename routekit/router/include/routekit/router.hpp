#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/middleware.hpp"
#include "routekit/path-params.hpp"
#include "routekit/router-config.hpp"
#include "routekit/vector.hpp"

namespace routekit {

// One '/'-delimited piece of a route pattern.
struct CompiledSegment {
  enum class Type : std::uint8_t { Literal, Param, Wildcard };

  Type type;
  std::string value;  // literal text for Literal, param name for Param, empty for Wildcard
};

// A registered (method, pattern) pair with its middlewares and handler.
// Routes are owned by the Router and immutable once registered, their address is stable.
class Route {
 public:
  // Only the Router can create routes.
  class PassKey {
   private:
    friend class Router;

    PassKey() = default;
  };

  Route(PassKey, http::Method method, std::string pattern, vector<CompiledSegment> segments, RequestHandler handler,
        vector<Middleware> middlewares);

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] std::span<const CompiledSegment> segments() const noexcept { return _segments; }

  [[nodiscard]] std::span<const Middleware> middlewares() const noexcept { return _middlewares; }

  [[nodiscard]] const RequestHandler& handler() const noexcept { return _handler; }

  [[nodiscard]] bool hasWildcard() const noexcept {
    return !_segments.empty() && _segments.back().type == CompiledSegment::Type::Wildcard;
  }

  // Tries to match given path segments (as split by the Router), appending decoded captures to params on success.
  // params is left untouched on failure.
  bool match(std::string_view path, std::span<const std::string_view> pathSegments, PathParams& params) const;

 private:
  http::Method _method;
  std::string _pattern;
  vector<CompiledSegment> _segments;
  RequestHandler _handler;
  vector<Middleware> _middlewares;
};

// Outcome of a route match. A result without route means no route matched for this method and path.
struct RoutingResult {
  [[nodiscard]] bool hasHandler() const noexcept { return route != nullptr; }

  const Route* route{nullptr};
  PathParams params;
};

struct RouteInfo {
  http::Method method;
  std::string pattern;
};

// Route table.
// Patterns are made of '/'-separated segments:
//   - literal text, compared case-sensitively  ('/users')
//   - named parameters                         ('/users/:id'), binding one non-empty path segment
//   - a trailing wildcard                      ('/static/*'), capturing the rest of the path under the "*" key
// Captured values are percent-decoded (best effort: malformed escapes are kept verbatim).
//
// Routes of a given method are tried in registration order, the first matching route wins. There is no
// specificity scoring, so register specific routes before overlapping generic ones.
// A path only matching routes of another method is reported as not found.
class Router {
 public:
  using RouteAddedCallback = std::function<void(const Route&)>;

  explicit Router(RouterConfig config = {});

  Router(const Router&) = delete;
  Router(Router&&) noexcept = default;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) noexcept = default;

  ~Router() = default;

  // Registers a new route.
  // Throws std::invalid_argument if the pattern is invalid:
  //  - it does not start with '/'
  //  - a parameter has no name (':') or its name is used twice
  //  - '*' is not the last segment
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

  // Copies all routes of 'other' (with their handlers and middlewares) under given base path.
  // The base path is normalized (leading slash added, trailing slash removed), '/' or '' means no prefix.
  void mount(std::string_view basePath, const Router& other);

  // Resolves given raw (not decoded) path for given method.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  // All routes, in registration order.
  [[nodiscard]] vector<RouteInfo> routes() const;

  [[nodiscard]] std::size_t size() const noexcept { return _registrationOrder.size(); }

  [[nodiscard]] bool empty() const noexcept { return _registrationOrder.empty(); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Called after each successful registration, including routes added by mount() and by plugins.
  void setRouteAddedCallback(RouteAddedCallback callback) { _routeAddedCallback = std::move(callback); }

 private:
  vector<CompiledSegment> compilePattern(std::string_view& pattern) const;

  RouterConfig _config;
  std::array<vector<std::unique_ptr<Route>>, http::kNbMethods> _routesPerMethod;
  vector<const Route*> _registrationOrder;
  RouteAddedCallback _routeAddedCallback;
};

// Normalizes a mount prefix: '' and '/' give '', 'api/' gives '/api'.
[[nodiscard]] std::string NormalizeBasePath(std::string_view basePath);

// Concatenates a normalized base path and a route pattern ('/api' + '/' gives '/api').
[[nodiscard]] std::string JoinPaths(std::string_view normalizedBase, std::string_view pattern);

}  // namespace routekit
