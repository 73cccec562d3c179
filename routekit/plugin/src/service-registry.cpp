#include "routekit/service-registry.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

namespace routekit {

void ServiceRegistry::addErased(std::string qualifiedName, std::shared_ptr<void> service, std::type_index type) {
  if (_frozen) {
    throw std::logic_error("Cannot register service '" + qualifiedName + "' after plugins have been started");
  }
  const auto [it, inserted] = _services.emplace(std::move(qualifiedName), Entry{std::move(service), type});
  if (!inserted) {
    throw std::logic_error("Service '" + it->first + "' is already registered");
  }
}

const ServiceRegistry::Entry* ServiceRegistry::findEntry(std::string_view qualifiedName) const {
  const auto it = _services.find(std::string(qualifiedName));
  return it == _services.end() ? nullptr : &it->second;
}

}  // namespace routekit
