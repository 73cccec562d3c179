#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "routekit/flat-hash-map.hpp"
#include "routekit/http-method.hpp"
#include "routekit/path-params.hpp"

namespace routekit {

class Route;

struct CacheEntry {
  const Route* route{nullptr};
  PathParams params;
  std::uint64_t hits{1};  // 1 on insertion, incremented on each hit
  std::chrono::steady_clock::time_point lastUsed;
};

struct CacheStats {
  std::size_t size{};
  std::uint64_t hits{};
  std::uint64_t misses{};
  double hitRate{};  // hits / (hits + misses), 0 when both are 0
};

// Builds the cache key of a request: "<METHOD>:<pathname>", query string excluded.
// Example: MakeCacheKey(http::Method::GET, "/users/42") -> "GET:/users/42"
[[nodiscard]] std::string MakeCacheKey(http::Method method, std::string_view path);

// Bounded LRU cache of route matches, keyed by MakeCacheKey.
// All operations are guarded by an internal mutex, a get() and its LRU promotion are atomic.
// Entries are never invalidated on route table changes, routes are expected to be registered before traffic begins.
class RouteMatchCache {
 public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  // A capacity of 0 disables the cache: set() does nothing and get() always misses.
  explicit RouteMatchCache(std::size_t capacity = kDefaultCapacity);

  // Returns a copy of the entry for given key, promoting it to most-recently-used.
  // Counts a hit or a miss.
  [[nodiscard]] std::optional<CacheEntry> get(std::string_view key);

  // Inserts or replaces the entry for given key, as most-recently-used.
  // If the cache is full, the least-recently-used entry is evicted first.
  void set(std::string_view key, const Route* route, PathParams params);

  // Removes all entries and resets hit / miss counters.
  void clear();

  [[nodiscard]] CacheStats stats() const;

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

 private:
  struct Node {
    std::string key;
    CacheEntry entry;
  };

  using LruList = std::list<Node>;  // front is the most recently used

  mutable std::mutex _mutex;
  LruList _lru;
  flat_hash_map<std::string, LruList::iterator> _index;
  std::uint64_t _hits{};
  std::uint64_t _misses{};
  std::size_t _capacity;
};

}  // namespace routekit
