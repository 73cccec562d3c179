#include "routekit/route-group.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/middleware.hpp"
#include "routekit/router.hpp"
#include "routekit/vector.hpp"

namespace routekit {

RouteGroup::RouteGroup(Router& router, std::string_view prefix, vector<Middleware> middlewares)
    : _router(router), _prefix(NormalizeBasePath(prefix)), _middlewares(std::move(middlewares)) {
  for (const Middleware& middleware : _middlewares) {
    if (!middleware) {
      throw std::invalid_argument("Route group middleware cannot be empty");
    }
  }
}

Route& RouteGroup::addRoute(http::Method method, std::string_view pattern, RequestHandler handler,
                            vector<Middleware> middlewares) {
  vector<Middleware> allMiddlewares(_middlewares.begin(), _middlewares.end());
  for (Middleware& middleware : middlewares) {
    allMiddlewares.push_back(std::move(middleware));
  }
  return _router.addRoute(method, JoinPaths(_prefix, pattern), std::move(handler), std::move(allMiddlewares));
}

RouteGroup& RouteGroup::use(Middleware middleware) {
  if (!middleware) {
    throw std::invalid_argument("Route group middleware cannot be empty");
  }
  _middlewares.push_back(std::move(middleware));
  return *this;
}

RouteGroup RouteGroup::group(std::string_view prefix, vector<Middleware> middlewares) const {
  vector<Middleware> allMiddlewares(_middlewares.begin(), _middlewares.end());
  for (Middleware& middleware : middlewares) {
    allMiddlewares.push_back(std::move(middleware));
  }
  return {_router, JoinPaths(_prefix, NormalizeBasePath(prefix)), std::move(allMiddlewares)};
}

}  // namespace routekit
