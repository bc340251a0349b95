#pragma once

// Logging goes through spdlog, header-only. SPDLOG_HEADER_ONLY is forced locally rather than exported as a public
// compile definition, so consumers remain free to link the compiled spdlog variant.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace hearth {
namespace log = spdlog;
}  // namespace hearth
