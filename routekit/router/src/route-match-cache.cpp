#include "routekit/route-match-cache.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routekit/http-method.hpp"
#include "routekit/log.hpp"

namespace routekit {

std::string MakeCacheKey(http::Method method, std::string_view path) {
  const std::string_view methodStr = http::MethodToStr(method);
  std::string key;
  key.reserve(methodStr.size() + 1U + path.size());
  key.append(methodStr).push_back(':');
  key.append(path);
  return key;
}

RouteMatchCache::RouteMatchCache(std::size_t capacity) : _capacity(capacity) {}

std::optional<CacheEntry> RouteMatchCache::get(std::string_view key) {
  std::scoped_lock lock(_mutex);
  auto it = _index.find(std::string(key));
  if (it == _index.end()) {
    ++_misses;
    return std::nullopt;
  }
  auto nodeIt = it->second;
  _lru.splice(_lru.begin(), _lru, nodeIt);
  CacheEntry& entry = nodeIt->entry;
  ++entry.hits;
  entry.lastUsed = std::chrono::steady_clock::now();
  ++_hits;
  return entry;
}

void RouteMatchCache::set(std::string_view key, const Route* route, PathParams params) {
  if (_capacity == 0) {
    return;
  }
  std::scoped_lock lock(_mutex);
  const auto now = std::chrono::steady_clock::now();
  std::string keyStr(key);
  auto it = _index.find(keyStr);
  if (it != _index.end()) {
    auto nodeIt = it->second;
    nodeIt->entry = CacheEntry{route, std::move(params), 1, now};
    _lru.splice(_lru.begin(), _lru, nodeIt);
    return;
  }
  if (_lru.size() >= _capacity) {
    log::debug("Route cache full ({} entries), evicting '{}'", _lru.size(), _lru.back().key);
    _index.erase(_lru.back().key);
    _lru.pop_back();
  }
  _lru.push_front(Node{keyStr, CacheEntry{route, std::move(params), 1, now}});
  _index.emplace(std::move(keyStr), _lru.begin());
}

void RouteMatchCache::clear() {
  std::scoped_lock lock(_mutex);
  _index.clear();
  _lru.clear();
  _hits = 0;
  _misses = 0;
}

CacheStats RouteMatchCache::stats() const {
  std::scoped_lock lock(_mutex);
  const std::uint64_t total = std::max<std::uint64_t>(1, _hits + _misses);
  return CacheStats{_lru.size(), _hits, _misses, static_cast<double>(_hits) / static_cast<double>(total)};
}

std::size_t RouteMatchCache::size() const {
  std::scoped_lock lock(_mutex);
  return _lru.size();
}

}  // namespace routekit
