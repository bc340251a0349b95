#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>

#include "hearth/vector.hpp"

namespace hearth {

// A bounded pool of fixed capacity byte buffers used to accumulate request bodies.
//
// At most nbBuffers buffers can be leased at the same time. Buffers are allocated lazily on first use and recycled
// afterwards, so an idle server does not pay for the whole pool. Each buffer is owned by exactly one Lease at a time
// and goes back to the pool when the Lease is destroyed, whatever the outcome of the body read.
//
// The pool must outlive all its leases. Not thread-safe: meant to be used by a single event loop.
class BufferPool {
 public:
  class Lease {
   public:
    // An empty lease, owning no buffer.
    Lease() noexcept = default;

    Lease(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&& other) noexcept;

    ~Lease() { release(); }

    [[nodiscard]] char* data() noexcept { return _buffer.get(); }
    [[nodiscard]] const char* data() const noexcept { return _buffer.get(); }

    [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

    [[nodiscard]] std::span<char> span() noexcept { return {_buffer.get(), _capacity}; }

    explicit operator bool() const noexcept { return static_cast<bool>(_buffer); }

    // Gives the buffer back to its pool now. No-op for an empty lease.
    void release() noexcept;

   private:
    friend class BufferPool;

    Lease(BufferPool* pPool, std::unique_ptr<char[]> buffer, std::size_t capacity) noexcept
        : _pPool(pPool), _buffer(std::move(buffer)), _capacity(capacity) {}

    BufferPool* _pPool{nullptr};
    std::unique_ptr<char[]> _buffer;
    std::size_t _capacity{0};
  };

  // Throws std::invalid_argument if bufferBytes or nbBuffers is 0.
  BufferPool(std::size_t bufferBytes, std::size_t nbBuffers);

  BufferPool(const BufferPool&) = delete;
  BufferPool(BufferPool&&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool& operator=(BufferPool&&) = delete;

  ~BufferPool() = default;

  // Leases a buffer. Returns std::nullopt when all buffers are currently leased (pool exhausted).
  [[nodiscard]] std::optional<Lease> acquire();

  [[nodiscard]] std::size_t bufferBytes() const noexcept { return _bufferBytes; }

  // Maximum number of buffers that can be leased simultaneously.
  [[nodiscard]] std::size_t capacity() const noexcept { return _nbBuffers; }

  [[nodiscard]] std::size_t nbLeased() const noexcept { return _nbLeased; }

  [[nodiscard]] std::size_t nbAvailable() const noexcept { return _nbBuffers - _nbLeased; }

  // Number of buffers allocated so far (leased or idle in the free list).
  [[nodiscard]] std::size_t nbAllocated() const noexcept { return _nbLeased + _freeBuffers.size(); }

 private:
  void giveBack(std::unique_ptr<char[]> buffer) noexcept;

  std::size_t _bufferBytes;
  std::size_t _nbBuffers;
  std::size_t _nbLeased{0};
  vector<std::unique_ptr<char[]>> _freeBuffers;
};

}  // namespace hearth
