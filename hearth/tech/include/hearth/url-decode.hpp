#pragma once

#include <string>
#include <string_view>

namespace hearth::url {

// Percent-decodes [first, last) in place, replacing '+' by 'plusAs'.
// Returns a pointer to the new logical end, or nullptr if an invalid '%' escape was met (in which case the content of
// [first, last) is unspecified).
char* DecodeInPlace(char* first, const char* last, char plusAs = '+');

// Decodes a single URI component the way decodeURIComponent of web platforms does:
//  - '%XY' escapes are decoded, '+' is kept literal,
//  - a truncated or non hexadecimal escape, or a decoded result that is not valid UTF-8, is a failure.
// Returns true and fills 'out' on success, false otherwise.
[[nodiscard]] bool DecodeComponent(std::string_view encoded, std::string& out);

}  // namespace hearth::url
