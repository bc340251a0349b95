#pragma once

#include <bit>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

namespace hearth::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(1U << methodIdx); }

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Parse a request line method token. Method names are case-sensitive.
// Returns std::nullopt for unknown methods.
constexpr std::optional<Method> MethodFromStr(std::string_view str) {
  for (MethodIdx idx = 0; idx < kNbMethods; ++idx) {
    if (kMethodStrings[idx] == str) {
      return MethodFromIdx(idx);
    }
  }
  return std::nullopt;
}

// GET and HEAD requests never have their body parsed.
constexpr bool IsBodylessMethod(Method method) { return method == Method::GET || method == Method::HEAD; }

}  // namespace hearth::http
