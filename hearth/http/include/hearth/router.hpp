#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "hearth/flat-hash-map.hpp"
#include "hearth/http-method.hpp"
#include "hearth/lru-cache.hpp"

namespace hearth {

class HttpRequest;
class HttpResponseWriter;

// Maps (method, path) pairs to request handlers.
//
// Resolution is two-tiered:
//  1. the observed URL cache, keyed by "METHOD:<raw target>" (query string included), bounded by LRU eviction,
//  2. the canonical table, keyed by "METHOD:<path>" (exact, case-sensitive match, no patterns).
// A canonical hit populates the cache under the raw target key, so each distinct query string of a path creates its
// own cache entry.
//
// Registering a handler clears the cache, so that an overwritten handler is never served from it.
class Router {
 public:
  using Handler = std::function<void(const HttpRequest&, HttpResponseWriter&)>;

  static constexpr std::size_t kDefaultCacheCapacity = 1024;

  explicit Router(std::size_t cacheCapacity = kDefaultCacheCapacity) : _cache(cacheCapacity) {}

  // The observed URL cache holds pointers into the handler table of its own Router: it is never carried over
  // by copies and moves.
  Router(const Router& other);
  Router(Router&& other) noexcept;
  Router& operator=(const Router& other);
  Router& operator=(Router&& other) noexcept;

  ~Router() = default;

  // Registers handler for given method and exact path. Re-registering the same pair silently replaces the handler.
  // Throws std::invalid_argument if path is empty or handler is empty.
  Router& setPath(http::Method method, std::string_view path, Handler handler);

  Router& get(std::string_view path, Handler handler) { return setPath(http::Method::GET, path, std::move(handler)); }

  Router& post(std::string_view path, Handler handler) { return setPath(http::Method::POST, path, std::move(handler)); }

  Router& put(std::string_view path, Handler handler) { return setPath(http::Method::PUT, path, std::move(handler)); }

  Router& del(std::string_view path, Handler handler) {
    return setPath(http::Method::DELETE, path, std::move(handler));
  }

  // Finds the handler of given method and raw request target (path with optional query string).
  // Returns nullptr if no handler is registered for this method and path.
  // The returned pointer is valid until next registration.
  [[nodiscard]] const Handler* resolve(http::Method method, std::string_view target);

  // Changes the capacity of the observed URL cache, dropping its content. 0 disables it.
  void setCacheCapacity(std::size_t capacity);

  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _routes.size(); }

  [[nodiscard]] std::size_t cacheSize() const noexcept { return _cache.size(); }

  [[nodiscard]] std::size_t cacheCapacity() const noexcept { return _cache.capacity(); }

  // Tells whether the observed URL cache has an entry for this method and raw target.
  [[nodiscard]] bool isCached(http::Method method, std::string_view target) const;

  // Builds the "METHOD:<pathOrTarget>" key used by both tiers, and by the response cache.
  [[nodiscard]] static std::string BuildKey(http::Method method, std::string_view pathOrTarget);

 private:
  flat_hash_map<std::string, Handler> _routes;
  LruCache<std::string, const Handler*> _cache;
};

}  // namespace hearth
