#pragma once

#include <functional>
#include <string>

#include "routekit/flat-hash-map.hpp"
#include "routekit/vector.hpp"

namespace routekit {

class PluginContext;

using PluginConfig = flat_hash_map<std::string, std::string>;

using PluginHook = std::function<void(PluginContext&)>;

struct PluginMetadata {
  std::string name;
  std::string version;
  std::string description;
  std::string author;
  // Names of plugins that must be registered before this one.
  vector<std::string> dependencies;
  vector<std::string> tags;
};

// Optional lifecycle callbacks. Empty hooks are skipped.
struct PluginHooks {
  PluginHook beforeRegister;
  PluginHook afterRegister;
  PluginHook beforeStart;
  PluginHook afterStart;
  PluginHook beforeStop;
  PluginHook afterStop;
};

// A unit of extension. registerFn receives the plugin context and typically adds routes, middlewares and services.
struct Plugin {
  PluginMetadata metadata;
  PluginHook registerFn;
  PluginHooks hooks;
  // Default configuration, overridden key by key by PluginRegistrationOptions::config.
  PluginConfig config;
};

struct PluginRegistrationOptions {
  PluginConfig config;
  // Prefix prepended to every route and scoped middleware added by the plugin ('' for none).
  std::string prefix;
};

}  // namespace routekit
