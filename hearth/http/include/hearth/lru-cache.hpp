#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <utility>

#include "hearth/flat-hash-map.hpp"

namespace hearth {

// Bounded key-value cache evicting the least recently used entry when full.
// A capacity of 0 disables the cache: inserts are ignored.
template <class K, class V, class H = std::hash<K>, class E = std::equal_to<K>>
class LruCache {
 public:
  explicit LruCache(std::size_t capacity = 0) : _capacity(capacity) {}

  LruCache(const LruCache& other) : _capacity(other._capacity) {
    for (const auto& [key, value] : other._entries) {
      _entries.emplace_back(key, value);
      _index.emplace(key, std::prev(_entries.end()));
    }
  }

  LruCache(LruCache&&) noexcept = default;

  LruCache& operator=(const LruCache& other) {
    if (this != &other) {
      LruCache copy(other);
      *this = std::move(copy);
    }
    return *this;
  }

  LruCache& operator=(LruCache&&) noexcept = default;

  ~LruCache() = default;

  // Returns a pointer to the value associated to key, or nullptr if absent.
  // A hit makes the entry the most recently used. The pointer is valid until next modification of the cache.
  [[nodiscard]] V* find(const K& key) {
    auto it = _index.find(key);
    if (it == _index.end()) {
      return nullptr;
    }
    _entries.splice(_entries.begin(), _entries, it->second);
    return &it->second->second;
  }

  // Tells whether key is present, without refreshing its recency.
  [[nodiscard]] bool contains(const K& key) const { return _index.find(key) != _index.end(); }

  // Inserts or replaces the value associated to key, making it the most recently used entry.
  // Evicts the least recently used entry if the cache is full.
  void insert(K key, V value) {
    if (_capacity == 0) {
      return;
    }
    auto it = _index.find(key);
    if (it != _index.end()) {
      it->second->second = std::move(value);
      _entries.splice(_entries.begin(), _entries, it->second);
      return;
    }
    if (_entries.size() == _capacity) {
      _index.erase(_entries.back().first);
      _entries.pop_back();
    }
    _entries.emplace_front(std::move(key), std::move(value));
    _index.emplace(_entries.front().first, _entries.begin());
  }

  void clear() noexcept {
    _index.clear();
    _entries.clear();
  }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

 private:
  using Entries = std::list<std::pair<K, V>>;

  std::size_t _capacity;
  Entries _entries;  // most recently used first
  flat_hash_map<K, typename Entries::iterator, H, E> _index;
};

}  // namespace hearth
