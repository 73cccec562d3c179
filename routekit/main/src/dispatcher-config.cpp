#include "routekit/dispatcher-config.hpp"

#include <cstddef>
#include <stdexcept>

#include "routekit/router-config.hpp"

namespace routekit {

void DispatcherConfig::validate() const {
  if (enableRouteCache && routeCacheCapacity == 0) {
    throw std::invalid_argument("routeCacheCapacity should be strictly positive when route cache is enabled");
  }
}

DispatcherConfig& DispatcherConfig::withRouterConfig(RouterConfig config) {
  routerConfig = config;
  return *this;
}

DispatcherConfig& DispatcherConfig::withRouteCacheCapacity(std::size_t capacity) {
  routeCacheCapacity = capacity;
  return *this;
}

DispatcherConfig& DispatcherConfig::withRouteCache(bool on) {
  enableRouteCache = on;
  return *this;
}

}  // namespace routekit
