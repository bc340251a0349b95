#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "hearth/buffer-pool.hpp"
#include "hearth/json.hpp"
#include "hearth/request-head-parser.hpp"

namespace hearth {

// Incremental request body decoder (Content-Length or chunked framing).
//
// Decoded bytes are accumulated into a buffer leased from a BufferPool. Without a lease, the body is consumed and
// discarded (used for GET and HEAD requests, and for requests that will not reach a handler), so that the next
// pipelined request can be found.
class BodyReader {
 public:
  enum class Status : uint8_t { NeedMore, Complete, Overflow, Malformed };

  struct FeedResult {
    std::size_t consumed;
    Status status;
  };

  // Max length of a chunk size line or of a trailer line.
  static constexpr std::size_t kMaxChunkLineLength = 1024;

  BodyReader() noexcept = default;

  // Starts reading a new body. 'lease' may be empty, in which case the body is discarded.
  void start(BodyFraming framing, std::size_t contentLength, BufferPool::Lease lease) noexcept;

  // Consumes body bytes from the beginning of 'data'.
  // Bytes that are not consumed (beyond the end of the body, or an incomplete chunk size line) stay with the caller.
  // Overflow is reported as soon as the body is known to exceed the leased buffer capacity (a body of exactly the
  // buffer capacity is accepted).
  [[nodiscard]] FeedResult feed(std::string_view data);

  // Parses the accumulated body as JSON and releases the leased buffer.
  // Returns an empty object for an empty, discarded, non UTF-8 or non JSON body.
  [[nodiscard]] Json finish();

  // Abandons the current body, releasing the leased buffer.
  void reset() noexcept;

  [[nodiscard]] bool isDiscarding() const noexcept { return !_lease; }

  // Number of decoded bytes accumulated so far.
  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  [[nodiscard]] std::string_view accumulated() const noexcept { return {_lease.data(), _size}; }

 private:
  enum class ChunkState : uint8_t { Size, Data, DataCRLF, Trailer };

  // Returns false if the leased buffer would overflow.
  bool append(std::string_view data) noexcept;

  FeedResult feedChunked(std::string_view data);

  BufferPool::Lease _lease;
  std::size_t _size{0};
  // Remaining bytes of the body (Content-Length) or of the current chunk (chunked)
  std::size_t _remaining{0};
  BodyFraming _framing{BodyFraming::None};
  ChunkState _chunkState{ChunkState::Size};
};

}  // namespace hearth
