#pragma once

#include <cstdint>

namespace routekit {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Normalize };

  // Behavior for resolving paths that differ only by a trailing slash.
  // Default: Normalize
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Normalize};

  // Policy for handling a trailing slash difference between registered patterns and incoming requests.
  //   Strict   : the request path is matched as is, '/users/42/' does not match '/users/:id'.
  //   Normalize: each route is first tried on the path as is, then, if the path ends with a slash (and is not the
  //              root), on the path without it. A trailing slash in a registered pattern is dropped at registration.
  //              '/users/42/' matches '/users/:id', and '/static/' still matches '/static/*' with an empty capture.
  //   The root path "/" is never normalized.
  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy);
};

}  // namespace routekit
