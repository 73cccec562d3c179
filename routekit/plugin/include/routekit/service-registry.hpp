#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "routekit/flat-hash-map.hpp"

namespace routekit {

// Services shared between plugins, indexed by qualified name ('<plugin>:<service>').
// Entries are added during plugin registration only: the registry is frozen when plugins are started, after which it
// is read-only and can be queried concurrently.
class ServiceRegistry {
 public:
  // Throws std::logic_error if the registry is frozen or if the name is already taken.
  template <class T>
  void add(std::string qualifiedName, std::shared_ptr<T> service) {
    addErased(std::move(qualifiedName), std::static_pointer_cast<void>(std::move(service)), typeid(T));
  }

  // Returns the service registered under given qualified name, or nullptr if there is none or if it has been
  // registered with another type.
  template <class T>
  [[nodiscard]] std::shared_ptr<T> find(std::string_view qualifiedName) const {
    const Entry* entry = findEntry(qualifiedName);
    if (entry == nullptr || entry->type != std::type_index(typeid(T))) {
      return nullptr;
    }
    return std::static_pointer_cast<T>(entry->service);
  }

  [[nodiscard]] bool contains(std::string_view qualifiedName) const { return findEntry(qualifiedName) != nullptr; }

  void freeze() noexcept { _frozen = true; }

  [[nodiscard]] bool frozen() const noexcept { return _frozen; }

  [[nodiscard]] std::size_t size() const noexcept { return _services.size(); }

 private:
  struct Entry {
    std::shared_ptr<void> service;
    std::type_index type;
  };

  void addErased(std::string qualifiedName, std::shared_ptr<void> service, std::type_index type);

  [[nodiscard]] const Entry* findEntry(std::string_view qualifiedName) const;

  flat_hash_map<std::string, Entry> _services;
  bool _frozen{false};
};

}  // namespace routekit
