#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace routekit {

class PluginError : public std::runtime_error {
 public:
  PluginError(std::string_view pluginName, const std::string& message);

  [[nodiscard]] const std::string& pluginName() const noexcept { return _pluginName; }

 private:
  std::string _pluginName;
};

// Thrown when a plugin name is registered twice.
class DuplicatePluginError : public PluginError {
 public:
  explicit DuplicatePluginError(std::string_view pluginName);
};

// Thrown when a plugin is registered before one of its dependencies.
class MissingDependencyError : public PluginError {
 public:
  MissingDependencyError(std::string_view pluginName, std::string_view dependency);

  [[nodiscard]] const std::string& dependency() const noexcept { return _dependency; }

 private:
  std::string _dependency;
};

// Thrown when a start or stop hook fails. The original exception is nested (see std::rethrow_if_nested).
class LifecycleHookError : public PluginError {
 public:
  LifecycleHookError(std::string_view pluginName, std::string_view hookName);

  [[nodiscard]] const std::string& hookName() const noexcept { return _hookName; }

 private:
  std::string _hookName;
};

}  // namespace routekit
