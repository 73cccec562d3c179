#pragma once

#include <cstddef>

#include "routekit/route-match-cache.hpp"
#include "routekit/router-config.hpp"

namespace routekit {

struct DispatcherConfig {
  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  // Route matching configuration (trailing slash policy).
  DispatcherConfig& withRouterConfig(RouterConfig config);

  // Maximum number of route matches kept in the LRU cache. Must be strictly positive when the cache is enabled.
  DispatcherConfig& withRouteCacheCapacity(std::size_t capacity);

  // Enable or disable the route match cache.
  DispatcherConfig& withRouteCache(bool on = true);

  RouterConfig routerConfig;

  std::size_t routeCacheCapacity{RouteMatchCache::kDefaultCapacity};

  bool enableRouteCache{true};
};

}  // namespace routekit
