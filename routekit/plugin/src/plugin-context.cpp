#include "routekit/plugin-context.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/log.hpp"
#include "routekit/middleware-pipeline.hpp"
#include "routekit/router.hpp"

namespace routekit {

PluginContext::PluginContext(PluginMetadata metadata, PluginConfig config, std::string_view prefix, Router& router,
                             MiddlewarePipeline& pipeline, ServiceRegistry& services)
    : _metadata(std::move(metadata)),
      _config(std::move(config)),
      _prefix(NormalizeBasePath(prefix)),
      _router(router),
      _pipeline(pipeline),
      _services(services) {}

std::optional<std::string_view> PluginContext::configValue(const std::string& key) const {
  const auto it = _config.find(key);
  if (it == _config.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void PluginContext::log(std::string_view message) const { log::info("[{}] {}", _metadata.name, message); }

Route& PluginContext::addRoute(http::Method method, std::string_view path, RequestHandler handler,
                               vector<Middleware> middlewares) {
  return _router.addRoute(method, JoinPaths(_prefix, path), std::move(handler), std::move(middlewares));
}

void PluginContext::addMiddleware(Middleware middleware) { _pipeline.use(std::move(middleware)); }

void PluginContext::addMiddleware(std::string_view scopePath, Middleware middleware) {
  _pipeline.use(JoinPaths(_prefix, scopePath), std::move(middleware));
}

std::string PluginContext::qualify(std::string_view name) const {
  std::string ret;
  ret.reserve(_metadata.name.size() + 1U + name.size());
  ret.append(_metadata.name);
  ret.push_back(':');
  ret.append(name);
  return ret;
}

}  // namespace routekit
