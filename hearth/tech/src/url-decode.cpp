#include "hearth/url-decode.hpp"

#include <string>
#include <string_view>

#include "hearth/char-hexadecimal-converter.hpp"
#include "hearth/utf8.hpp"

namespace hearth::url {

char* DecodeInPlace(char* first, const char* last, char plusAs) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (last - first < 3) {
          return nullptr;
        }
        const int v1 = from_hex_digit(first[1]);
        const int v2 = from_hex_digit(first[2]);
        if (v1 < 0 || v2 < 0) {
          return nullptr;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

bool DecodeComponent(std::string_view encoded, std::string& out) {
  out.assign(encoded);
  if (encoded.find('%') == std::string_view::npos) {
    // Nothing to decode - but the raw bytes still need to be valid UTF-8 to be representable as text.
    return IsValidUtf8(out);
  }
  char* newEnd = DecodeInPlace(out.data(), out.data() + out.size());
  if (newEnd == nullptr) {
    return false;
  }
  out.resize(static_cast<std::string::size_type>(newEnd - out.data()));
  return IsValidUtf8(out);
}

}  // namespace hearth::url
