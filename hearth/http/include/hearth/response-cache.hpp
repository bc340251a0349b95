#pragma once

#include <string>

#include "hearth/lru-cache.hpp"

namespace hearth {

// Serialized JSON bodies of 200 responses, keyed by "METHOD:observed URL".
// Entries are only written by HttpResponseWriter: nothing serves responses from it yet.
using ResponseCache = LruCache<std::string, std::string>;

}  // namespace hearth
