#include "routekit/middleware-pipeline.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/middleware.hpp"
#include "routekit/response-builder.hpp"
#include "routekit/router.hpp"
#include "routekit/vector.hpp"

namespace routekit {

HttpResponse Next::operator()() const {
  if (_pos < _chain.size()) {
    const Next next(_chain, _handler, _request, _pos + 1U);
    return (*_chain[_pos])(_request, next);
  }
  ResponseBuilder builder;
  _handler(_request, builder);
  return std::move(builder).takeResponse();
}

bool PathInScope(std::string_view path, std::string_view scope) noexcept {
  if (scope.empty()) {
    return true;
  }
  return path.starts_with(scope) && (path.size() == scope.size() || path[scope.size()] == '/');
}

void MiddlewarePipeline::use(Middleware middleware) {
  if (!middleware) {
    throw std::invalid_argument("Middleware cannot be empty");
  }
  _globalMiddlewares.push_back(std::move(middleware));
}

void MiddlewarePipeline::use(std::string_view scopePath, Middleware middleware) {
  if (!middleware) {
    throw std::invalid_argument("Middleware cannot be empty");
  }
  _scopedMiddlewares.push_back(ScopedMiddleware{NormalizeBasePath(scopePath), std::move(middleware)});
  std::ranges::stable_sort(_scopedMiddlewares, [](const ScopedMiddleware& lhs, const ScopedMiddleware& rhs) {
    return lhs.scope.size() < rhs.scope.size();
  });
}

HttpResponse MiddlewarePipeline::run(HttpRequest& request, const Route& route) const {
  return run(request, route.middlewares(), route.handler());
}

HttpResponse MiddlewarePipeline::run(HttpRequest& request, std::span<const Middleware> routeMiddlewares,
                                     const RequestHandler& handler) const {
  vector<const Middleware*> chain;
  chain.reserve(_globalMiddlewares.size() + _scopedMiddlewares.size() + routeMiddlewares.size());
  for (const Middleware& middleware : _globalMiddlewares) {
    chain.push_back(&middleware);
  }
  const std::string_view path = request.path();
  for (const ScopedMiddleware& scoped : _scopedMiddlewares) {
    if (PathInScope(path, scoped.scope)) {
      chain.push_back(&scoped.middleware);
    }
  }
  for (const Middleware& middleware : routeMiddlewares) {
    chain.push_back(&middleware);
  }

  const Next first(std::span<const Middleware* const>(chain.data(), chain.size()), handler, request, 0);
  return first();
}

}  // namespace routekit
