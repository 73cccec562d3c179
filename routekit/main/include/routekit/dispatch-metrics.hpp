#pragma once

#include <chrono>
#include <string_view>

#include "routekit/http-method.hpp"
#include "routekit/http-status-code.hpp"

namespace routekit {

// Per request metrics given to the Dispatcher metrics callback.
// path is a view on the request, only valid during the callback.
struct DispatchMetrics {
  http::Method method{http::Method::GET};
  std::string_view path;
  http::StatusCode status{};
  bool cacheHit{false};
  bool matched{false};
  // An exception escaped the middleware chain and was converted to a 500.
  bool threw{false};
  std::chrono::nanoseconds duration{};
};

}  // namespace routekit
