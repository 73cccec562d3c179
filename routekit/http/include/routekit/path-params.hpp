#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "routekit/vector.hpp"

namespace routekit {

struct PathParam {
  std::string key;
  std::string value;

  bool operator==(const PathParam&) const = default;
};

// Parameters extracted by a route match, in pattern order. The wildcard capture is stored under the "*" key.
using PathParams = vector<PathParam>;

[[nodiscard]] inline std::optional<std::string_view> FindPathParam(const PathParams& params, std::string_view key) {
  for (const auto& param : params) {
    if (param.key == key) {
      return std::string_view(param.value);
    }
  }
  return std::nullopt;
}

}  // namespace routekit
