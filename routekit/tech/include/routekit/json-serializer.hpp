#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace routekit {

/// Serialize a C++ object to JSON string using glaze.
/// Aggregates are reflected automatically, other types need a glz::meta specialization.
/// Returns an empty string if glaze reports a serialization error.
/// Example usage:
///   struct User { std::string id; };
///   auto json = routekit::SerializeToJson(User{"42"});  // {"id":"42"}
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace routekit
