#include "hearth/json.hpp"

#include <string>
#include <string_view>

#include "hearth/log.hpp"
#include "hearth/utf8.hpp"

namespace hearth {

Json ParseJsonOrEmptyObject(std::string_view text) {
  if (text.empty()) {
    return EmptyJsonObject();
  }
  if (!IsValidUtf8(text)) {
    log::debug("Body of {} bytes is not valid UTF-8, using an empty object", text.size());
    return EmptyJsonObject();
  }
  // glaze expects a null terminated buffer, which std::string guarantees.
  const std::string buffer(text);
  Json json;
  const auto ec = glz::read_json(json, buffer);
  if (ec) {
    log::debug("Body of {} bytes is not valid JSON ({}), using an empty object", text.size(),
               glz::format_error(ec, buffer));
    return EmptyJsonObject();
  }
  return json;
}

}  // namespace hearth
