#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "routekit/http-request.hpp"
#include "routekit/http-response.hpp"
#include "routekit/middleware.hpp"
#include "routekit/vector.hpp"

namespace routekit {

class Route;

// Ordered composition of the middlewares executed around a route handler.
// For a request, the chain is, from outermost to innermost:
//   1. global middlewares, in registration order
//   2. path-scoped middlewares whose scope matches the request path, broader (shorter) scopes first, registration
//      order for scopes of equal length
//   3. the route's own middlewares, in registration order
//   4. the route handler
class MiddlewarePipeline {
 public:
  // Adds a global middleware.
  void use(Middleware middleware);

  // Adds a middleware applied to requests whose path is scopePath or below it ('/api' matches '/api' and
  // '/api/users', not '/apix'). The scope is normalized like a mount path, '/' or '' is equivalent to a global
  // middleware registered in the scoped tier.
  void use(std::string_view scopePath, Middleware middleware);

  // Runs the chain for given request and route. Exceptions thrown by middlewares or the handler propagate.
  HttpResponse run(HttpRequest& request, const Route& route) const;

  HttpResponse run(HttpRequest& request, std::span<const Middleware> routeMiddlewares,
                   const RequestHandler& handler) const;

  [[nodiscard]] std::size_t nbGlobalMiddlewares() const noexcept { return _globalMiddlewares.size(); }

  [[nodiscard]] std::size_t nbScopedMiddlewares() const noexcept { return _scopedMiddlewares.size(); }

 private:
  struct ScopedMiddleware {
    std::string scope;
    Middleware middleware;
  };

  vector<Middleware> _globalMiddlewares;
  vector<ScopedMiddleware> _scopedMiddlewares;  // sorted by ascending scope length
};

// Tells whether given path is equal to the scope or nested below it.
[[nodiscard]] bool PathInScope(std::string_view path, std::string_view scope) noexcept;

}  // namespace routekit
