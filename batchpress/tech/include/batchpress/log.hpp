#pragma once

// Logging goes through spdlog. Call sites use batchpress::log::info(...) and friends so that the
// backend stays swappable in one place.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace batchpress {

namespace log = spdlog;

}  // namespace batchpress
