#pragma once

#include <string_view>

namespace hearth {

// Tells whether given bytes form a well-formed UTF-8 sequence (no overlongs, no surrogates, max U+10FFFF).
[[nodiscard]] bool IsValidUtf8(std::string_view data) noexcept;

}  // namespace hearth
