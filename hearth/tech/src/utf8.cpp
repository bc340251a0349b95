#include "hearth/utf8.hpp"

#include <cstddef>
#include <string_view>

namespace hearth {

bool IsValidUtf8(std::string_view data) noexcept {
  const auto* pos = reinterpret_cast<const unsigned char*>(data.data());
  const auto* end = pos + data.size();
  while (pos < end) {
    const unsigned char lead = *pos;
    if (lead < 0x80U) {
      ++pos;
      continue;
    }
    std::size_t nbContinuation;
    unsigned char minSecond = 0x80U;
    unsigned char maxSecond = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
      nbContinuation = 1;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
      nbContinuation = 2;
      if (lead == 0xE0U) {
        minSecond = 0xA0U;  // overlong
      } else if (lead == 0xEDU) {
        maxSecond = 0x9FU;  // surrogates
      }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
      nbContinuation = 3;
      if (lead == 0xF0U) {
        minSecond = 0x90U;  // overlong
      } else if (lead == 0xF4U) {
        maxSecond = 0x8FU;  // > U+10FFFF
      }
    } else {
      return false;
    }
    if (static_cast<std::size_t>(end - pos) <= nbContinuation) {
      return false;
    }
    if (pos[1] < minSecond || pos[1] > maxSecond) {
      return false;
    }
    for (std::size_t idx = 2; idx <= nbContinuation; ++idx) {
      if ((pos[idx] & 0xC0U) != 0x80U) {
        return false;
      }
    }
    pos += nbContinuation + 1;
  }
  return true;
}

}  // namespace hearth
