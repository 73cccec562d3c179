#include "routekit/router.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/log.hpp"
#include "routekit/middleware.hpp"
#include "routekit/path-params.hpp"
#include "routekit/router-config.hpp"
#include "routekit/url-decode.hpp"
#include "routekit/vector.hpp"

namespace routekit {
namespace {

constexpr std::string_view kWildcardKey = "*";

// Splits the path on '/' after its leading slash, keeping empty segments.
//   '/'        -> ['']
//   '/a/b'     -> ['a', 'b']
//   '/a/'      -> ['a', '']
//   '/a//b'    -> ['a', '', 'b']
void SplitPathSegments(std::string_view path, vector<std::string_view>& segments) {
  segments.clear();
  if (!path.empty() && path.front() == '/') {
    path.remove_prefix(1U);
  }
  std::size_t pos = 0;
  while (true) {
    const std::size_t nextSlash = path.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      segments.push_back(path.substr(pos));
      break;
    }
    segments.push_back(path.substr(pos, nextSlash - pos));
    pos = nextSlash + 1U;
  }
}

bool HasNormalizableTrailingSlash(RouterConfig::TrailingSlashPolicy policy, std::string_view path) {
  return policy == RouterConfig::TrailingSlashPolicy::Normalize && path.size() > 1U && path.back() == '/';
}

}  // namespace

Route::Route(PassKey, http::Method method, std::string pattern, vector<CompiledSegment> segments,
             RequestHandler handler, vector<Middleware> middlewares)
    : _method(method),
      _pattern(std::move(pattern)),
      _segments(std::move(segments)),
      _handler(std::move(handler)),
      _middlewares(std::move(middlewares)) {}

bool Route::match(std::string_view path, std::span<const std::string_view> pathSegments, PathParams& params) const {
  const bool wildcard = hasWildcard();
  const std::size_t nbFixedSegments = wildcard ? _segments.size() - 1U : _segments.size();
  if (wildcard ? pathSegments.size() < _segments.size() : pathSegments.size() != _segments.size()) {
    return false;
  }

  // first pass without allocation to reject quickly on literal mismatch or empty param
  for (std::size_t segPos = 0; segPos < nbFixedSegments; ++segPos) {
    const CompiledSegment& segment = _segments[segPos];
    switch (segment.type) {
      case CompiledSegment::Type::Literal:
        if (segment.value != pathSegments[segPos]) {
          return false;
        }
        break;
      case CompiledSegment::Type::Param:
        if (pathSegments[segPos].empty()) {
          return false;
        }
        break;
      default:
        break;
    }
  }

  for (std::size_t segPos = 0; segPos < nbFixedSegments; ++segPos) {
    const CompiledSegment& segment = _segments[segPos];
    if (segment.type == CompiledSegment::Type::Param) {
      params.push_back(PathParam{segment.value, url::DecodeComponent(pathSegments[segPos])});
    }
  }
  if (wildcard) {
    // the rest of the path, from the first absorbed segment (embedded slashes included)
    const std::string_view firstAbsorbed = pathSegments[nbFixedSegments];
    const auto offset = static_cast<std::size_t>(firstAbsorbed.data() - path.data());
    params.push_back(PathParam{std::string(kWildcardKey), url::DecodeComponent(path.substr(offset))});
  }
  return true;
}

Router::Router(RouterConfig config) : _config(std::move(config)) {}

vector<CompiledSegment> Router::compilePattern(std::string_view& pattern) const {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("Route pattern must start with '/'");
  }
  if (HasNormalizableTrailingSlash(_config.trailingSlashPolicy, pattern)) {
    pattern.remove_suffix(1U);
  }

  vector<std::string_view> rawSegments;
  SplitPathSegments(pattern, rawSegments);

  vector<CompiledSegment> segments;
  segments.reserve(rawSegments.size());
  for (std::size_t segPos = 0; segPos < rawSegments.size(); ++segPos) {
    const std::string_view rawSegment = rawSegments[segPos];
    if (rawSegment == kWildcardKey) {
      if (segPos + 1U != rawSegments.size()) {
        throw std::invalid_argument("Wildcard '*' is only allowed as the last segment of a route pattern");
      }
      segments.push_back(CompiledSegment{CompiledSegment::Type::Wildcard, std::string{}});
    } else if (!rawSegment.empty() && rawSegment.front() == ':') {
      std::string_view name = rawSegment.substr(1);
      if (name.empty()) {
        throw std::invalid_argument("Route parameter name cannot be empty");
      }
      for (const auto& prev : segments) {
        if (prev.type == CompiledSegment::Type::Param && prev.value == name) {
          throw std::invalid_argument("Route parameter name is used twice in the same pattern");
        }
      }
      segments.push_back(CompiledSegment{CompiledSegment::Type::Param, std::string(name)});
    } else {
      segments.push_back(CompiledSegment{CompiledSegment::Type::Literal, std::string(rawSegment)});
    }
  }
  return segments;
}

Route& Router::addRoute(http::Method method, std::string_view pattern, RequestHandler handler,
                        vector<Middleware> middlewares) {
  if (!handler) {
    throw std::invalid_argument("Route handler cannot be empty");
  }
  auto segments = compilePattern(pattern);

  auto& routes = _routesPerMethod[http::MethodToIdx(method)];
  routes.push_back(std::make_unique<Route>(Route::PassKey{}, method, std::string(pattern), std::move(segments),
                                           std::move(handler), std::move(middlewares)));
  Route& route = *routes.back();
  _registrationOrder.push_back(&route);
  log::debug("Registered route {} {}", http::MethodToStr(method), route.pattern());
  if (_routeAddedCallback) {
    _routeAddedCallback(route);
  }
  return route;
}

void Router::mount(std::string_view basePath, const Router& other) {
  const std::string normalizedBase = NormalizeBasePath(basePath);
  // copy first, in case other is this router
  const vector<const Route*> toMount = other._registrationOrder;
  for (const Route* route : toMount) {
    vector<Middleware> middlewares(route->middlewares().begin(), route->middlewares().end());
    addRoute(route->method(), JoinPaths(normalizedBase, route->pattern()), route->handler(), std::move(middlewares));
  }
}

RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  const auto& routes = _routesPerMethod[http::MethodToIdx(method)];
  if (routes.empty()) {
    return result;
  }

  vector<std::string_view> segments;
  SplitPathSegments(path, segments);

  std::string_view strippedPath;
  vector<std::string_view> strippedSegments;
  const bool tryStripped = HasNormalizableTrailingSlash(_config.trailingSlashPolicy, path);
  if (tryStripped) {
    strippedPath = path.substr(0, path.size() - 1U);
    SplitPathSegments(strippedPath, strippedSegments);
  }

  for (const auto& route : routes) {
    if (route->match(path, segments, result.params) ||
        (tryStripped && route->match(strippedPath, strippedSegments, result.params))) {
      result.route = route.get();
      break;
    }
  }
  return result;
}

vector<RouteInfo> Router::routes() const {
  vector<RouteInfo> ret;
  ret.reserve(_registrationOrder.size());
  for (const Route* route : _registrationOrder) {
    ret.push_back(RouteInfo{route->method(), std::string(route->pattern())});
  }
  return ret;
}

std::string NormalizeBasePath(std::string_view basePath) {
  while (!basePath.empty() && basePath.back() == '/') {
    basePath.remove_suffix(1U);
  }
  std::string ret;
  if (basePath.empty()) {
    return ret;
  }
  if (basePath.front() != '/') {
    ret.push_back('/');
  }
  ret.append(basePath);
  return ret;
}

std::string JoinPaths(std::string_view normalizedBase, std::string_view pattern) {
  if (normalizedBase.empty()) {
    return std::string(pattern);
  }
  if (pattern == "/" || pattern.empty()) {
    return std::string(normalizedBase);
  }
  std::string ret(normalizedBase);
  if (pattern.front() != '/') {
    ret.push_back('/');
  }
  ret.append(pattern);
  return ret;
}

}  // namespace routekit
