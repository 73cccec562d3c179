#include "routekit/router-config.hpp"

namespace routekit {

RouterConfig& RouterConfig::withTrailingSlashPolicy(TrailingSlashPolicy policy) {
  trailingSlashPolicy = policy;
  return *this;
}

}  // namespace routekit
