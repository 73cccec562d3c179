#pragma once

#include <cstdint>
#include <string_view>

namespace routekit {

// Lifecycle of a plugin, in order.
enum class PluginStatus : std::uint8_t {
  Unregistered,
  Registering,
  Registered,
  Starting,
  Started,
  Stopping,
  Stopped,
};

[[nodiscard]] constexpr std::string_view PluginStatusToStr(PluginStatus status) noexcept {
  switch (status) {
    case PluginStatus::Unregistered:
      return "unregistered";
    case PluginStatus::Registering:
      return "registering";
    case PluginStatus::Registered:
      return "registered";
    case PluginStatus::Starting:
      return "starting";
    case PluginStatus::Started:
      return "started";
    case PluginStatus::Stopping:
      return "stopping";
    case PluginStatus::Stopped:
      return "stopped";
    default:
      return "unknown";
  }
}

}  // namespace routekit
