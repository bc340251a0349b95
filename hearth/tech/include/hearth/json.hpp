#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>
#include <string_view>

namespace hearth {

/// Generic JSON document, used for request bodies whose shape is only known by the handler.
using Json = glz::json_t;

/// Returns an empty JSON object ('{}').
inline Json EmptyJsonObject() { return Json{Json::object_t{}}; }

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize (aggregates are reflected automatically).
/// Returns an empty string if serialization failed.
/// Example usage:
///   struct Status { std::string status; };
///   auto jsonStr = hearth::SerializeToJson(Status{"healthy"});  // {"status":"healthy"}
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

/// Parse given UTF-8 text as a generic JSON document.
/// Returns an empty JSON object if the text is empty, not valid UTF-8 or not valid JSON.
[[nodiscard]] Json ParseJsonOrEmptyObject(std::string_view text);

}  // namespace hearth
