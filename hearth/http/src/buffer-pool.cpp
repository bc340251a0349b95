#include "hearth/buffer-pool.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "hearth/log.hpp"

namespace hearth {

BufferPool::Lease::Lease(Lease&& other) noexcept
    : _pPool(std::exchange(other._pPool, nullptr)),
      _buffer(std::move(other._buffer)),
      _capacity(std::exchange(other._capacity, 0)) {}

BufferPool::Lease& BufferPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = std::exchange(other._pPool, nullptr);
    _buffer = std::move(other._buffer);
    _capacity = std::exchange(other._capacity, 0);
  }
  return *this;
}

void BufferPool::Lease::release() noexcept {
  if (_buffer) {
    _pPool->giveBack(std::move(_buffer));
    _pPool = nullptr;
    _capacity = 0;
  }
}

BufferPool::BufferPool(std::size_t bufferBytes, std::size_t nbBuffers)
    : _bufferBytes(bufferBytes), _nbBuffers(nbBuffers) {
  if (bufferBytes == 0) {
    throw std::invalid_argument("BufferPool buffer size must be > 0");
  }
  if (nbBuffers == 0) {
    throw std::invalid_argument("BufferPool must hold at least one buffer");
  }
  _freeBuffers.reserve(static_cast<decltype(_freeBuffers)::size_type>(nbBuffers));
}

std::optional<BufferPool::Lease> BufferPool::acquire() {
  if (_nbLeased == _nbBuffers) {
    log::warn("Buffer pool exhausted ({} buffers of {} bytes leased)", _nbLeased, _bufferBytes);
    return std::nullopt;
  }
  std::unique_ptr<char[]> buffer;
  if (_freeBuffers.empty()) {
    buffer = std::make_unique_for_overwrite<char[]>(_bufferBytes);
  } else {
    buffer = std::move(_freeBuffers.back());
    _freeBuffers.pop_back();
  }
  ++_nbLeased;
  return Lease(this, std::move(buffer), _bufferBytes);
}

void BufferPool::giveBack(std::unique_ptr<char[]> buffer) noexcept {
  --_nbLeased;
  // Cannot reallocate: capacity for all buffers was reserved at construction.
  _freeBuffers.push_back(std::move(buffer));
}

}  // namespace hearth
