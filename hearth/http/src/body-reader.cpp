#include "hearth/body-reader.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <string_view>
#include <utility>

#include "hearth/buffer-pool.hpp"
#include "hearth/char-hexadecimal-converter.hpp"
#include "hearth/http-constants.hpp"
#include "hearth/json.hpp"
#include "hearth/log.hpp"

namespace hearth {

void BodyReader::start(BodyFraming framing, std::size_t contentLength, BufferPool::Lease lease) noexcept {
  _lease = std::move(lease);
  _size = 0;
  _framing = framing;
  _remaining = framing == BodyFraming::ContentLength ? contentLength : 0;
  _chunkState = ChunkState::Size;
}

bool BodyReader::append(std::string_view data) noexcept {
  if (!_lease) {
    return true;
  }
  if (data.size() > _lease.capacity() - _size) {
    return false;
  }
  std::memcpy(_lease.data() + _size, data.data(), data.size());
  _size += data.size();
  return true;
}

BodyReader::FeedResult BodyReader::feed(std::string_view data) {
  switch (_framing) {
    case BodyFraming::None:
      return {0, Status::Complete};
    case BodyFraming::ContentLength: {
      if (_lease && _size + _remaining > _lease.capacity()) {
        return {0, Status::Overflow};
      }
      const std::size_t nbBytes = std::min(_remaining, data.size());
      append(data.substr(0, nbBytes));
      _remaining -= nbBytes;
      return {nbBytes, _remaining == 0 ? Status::Complete : Status::NeedMore};
    }
    case BodyFraming::Chunked:
      return feedChunked(data);
    default:
      std::unreachable();
  }
}

BodyReader::FeedResult BodyReader::feedChunked(std::string_view data) {
  std::size_t consumed = 0;
  while (consumed < data.size()) {
    std::string_view remaining = data.substr(consumed);
    switch (_chunkState) {
      case ChunkState::Size: {
        const auto lineEnd = remaining.find(http::CRLF);
        if (lineEnd == std::string_view::npos) {
          if (remaining.size() > kMaxChunkLineLength) {
            return {consumed, Status::Malformed};
          }
          return {consumed, Status::NeedMore};
        }
        // chunk-size [ ; chunk-ext ]
        std::string_view sizeStr = remaining.substr(0, lineEnd);
        sizeStr = sizeStr.substr(0, sizeStr.find(';'));
        while (!sizeStr.empty() && (sizeStr.back() == ' ' || sizeStr.back() == '\t')) {
          sizeStr.remove_suffix(1);
        }
        if (sizeStr.empty()) {
          return {consumed, Status::Malformed};
        }
        std::size_t chunkSize = 0;
        for (char ch : sizeStr) {
          const int digit = from_hex_digit(ch);
          if (digit < 0 || chunkSize > (std::numeric_limits<std::size_t>::max() >> 4U)) {
            log::debug("Invalid chunk size line '{}'", remaining.substr(0, lineEnd));
            return {consumed, Status::Malformed};
          }
          chunkSize = (chunkSize << 4U) | static_cast<std::size_t>(digit);
        }
        consumed += lineEnd + http::CRLF.size();
        if (chunkSize == 0) {
          _chunkState = ChunkState::Trailer;
        } else {
          if (_lease && chunkSize > _lease.capacity() - _size) {
            return {consumed, Status::Overflow};
          }
          _remaining = chunkSize;
          _chunkState = ChunkState::Data;
        }
        break;
      }
      case ChunkState::Data: {
        const std::size_t nbBytes = std::min(_remaining, remaining.size());
        append(remaining.substr(0, nbBytes));
        _remaining -= nbBytes;
        consumed += nbBytes;
        if (_remaining == 0) {
          _chunkState = ChunkState::DataCRLF;
        }
        break;
      }
      case ChunkState::DataCRLF:
        if (remaining.size() < http::CRLF.size()) {
          return {consumed, Status::NeedMore};
        }
        if (!remaining.starts_with(http::CRLF)) {
          return {consumed, Status::Malformed};
        }
        consumed += http::CRLF.size();
        _chunkState = ChunkState::Size;
        break;
      case ChunkState::Trailer: {
        // Trailer fields are ignored, the body ends at the first empty line.
        const auto lineEnd = remaining.find(http::CRLF);
        if (lineEnd == std::string_view::npos) {
          if (remaining.size() > kMaxChunkLineLength) {
            return {consumed, Status::Malformed};
          }
          return {consumed, Status::NeedMore};
        }
        consumed += lineEnd + http::CRLF.size();
        if (lineEnd == 0) {
          _framing = BodyFraming::None;
          return {consumed, Status::Complete};
        }
        break;
      }
      default:
        std::unreachable();
    }
  }
  return {consumed, Status::NeedMore};
}

Json BodyReader::finish() {
  Json body = ParseJsonOrEmptyObject(accumulated());
  reset();
  return body;
}

void BodyReader::reset() noexcept {
  _lease.release();
  _size = 0;
  _remaining = 0;
  _framing = BodyFraming::None;
  _chunkState = ChunkState::Size;
}

}  // namespace hearth
