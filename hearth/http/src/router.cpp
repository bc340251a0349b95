#include "hearth/router.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "hearth/http-method.hpp"
#include "hearth/log.hpp"

namespace hearth {

Router::Router(const Router& other) : _routes(other._routes), _cache(other._cache.capacity()) {}

Router::Router(Router&& other) noexcept
    : _routes(std::move(other._routes)), _cache(other._cache.capacity()) {
  other._cache.clear();
}

Router& Router::operator=(const Router& other) {
  if (this != &other) {
    _routes = other._routes;
    _cache = LruCache<std::string, const Handler*>(other._cache.capacity());
  }
  return *this;
}

Router& Router::operator=(Router&& other) noexcept {
  if (this != &other) {
    _routes = std::move(other._routes);
    _cache = LruCache<std::string, const Handler*>(other._cache.capacity());
    other._cache.clear();
  }
  return *this;
}

std::string Router::BuildKey(http::Method method, std::string_view pathOrTarget) {
  const std::string_view methodStr = http::MethodToStr(method);
  std::string key;
  key.reserve(methodStr.size() + 1U + pathOrTarget.size());
  key.append(methodStr).push_back(':');
  key.append(pathOrTarget);
  return key;
}

Router& Router::setPath(http::Method method, std::string_view path, Handler handler) {
  if (path.empty()) {
    throw std::invalid_argument("Cannot register a handler for an empty path");
  }
  if (!handler) {
    throw std::invalid_argument("Cannot register an empty handler");
  }
  auto key = BuildKey(method, path);
  auto it = _routes.find(key);
  if (it == _routes.end()) {
    _routes.emplace(std::move(key), std::move(handler));
  } else {
    log::debug("Handler for {} replaced", key);
    it->second = std::move(handler);
  }
  _cache.clear();
  return *this;
}

const Router::Handler* Router::resolve(http::Method method, std::string_view target) {
  std::string cacheKey = BuildKey(method, target);
  if (const Handler** ppCached = _cache.find(cacheKey); ppCached != nullptr) {
    return *ppCached;
  }

  const std::string_view path = target.substr(0, target.find('?'));
  const Handler* pHandler = nullptr;
  if (path.size() == target.size()) {
    auto it = _routes.find(cacheKey);
    if (it != _routes.end()) {
      pHandler = &it->second;
    }
  } else {
    auto it = _routes.find(BuildKey(method, path));
    if (it != _routes.end()) {
      pHandler = &it->second;
    }
  }
  if (pHandler != nullptr) {
    _cache.insert(std::move(cacheKey), pHandler);
  }
  return pHandler;
}

void Router::setCacheCapacity(std::size_t capacity) {
  _cache = LruCache<std::string, const Handler*>(capacity);
}

bool Router::isCached(http::Method method, std::string_view target) const {
  return _cache.contains(BuildKey(method, target));
}

}  // namespace hearth
