#pragma once

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/middleware.hpp"
#include "routekit/router.hpp"
#include "routekit/vector.hpp"

namespace routekit {

// Registers routes on a Router under a common path prefix, with a common list of middlewares.
// Each route gets the pattern prefix + pattern, and the middlewares of the group followed by its own ones.
// Example:
//   RouteGroup admin(router, "/admin", {requireAuth});
//   admin.get("/users", listUsers);  // GET /admin/users, runs requireAuth then listUsers
//
// The group only forwards to the Router, it does not own any route. The Router must outlive it.
class RouteGroup {
 public:
  // The prefix is normalized like a mount base path ('' and '/' mean no prefix, 'api/' gives '/api').
  RouteGroup(Router& router, std::string_view prefix, vector<Middleware> middlewares = {});

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

  // Appends a middleware to the group. Routes already registered through the group are not affected.
  RouteGroup& use(Middleware middleware);

  // Nested group: prefixes are concatenated, middlewares of this group come first.
  [[nodiscard]] RouteGroup group(std::string_view prefix, vector<Middleware> middlewares = {}) const;

  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

  [[nodiscard]] std::span<const Middleware> middlewares() const noexcept { return _middlewares; }

 private:
  Router& _router;
  std::string _prefix;
  vector<Middleware> _middlewares;
};

}  // namespace routekit
