#pragma once

namespace batchpress {

#ifdef BATCHPRESS_ENABLE_ZLIB
constexpr bool zlibEnabled() { return true; }
#else
constexpr bool zlibEnabled() { return false; }
#endif

#ifdef BATCHPRESS_ENABLE_ZSTD
constexpr bool zstdEnabled() { return true; }
#else
constexpr bool zstdEnabled() { return false; }
#endif

#ifdef BATCHPRESS_ENABLE_BROTLI
constexpr bool brotliEnabled() { return true; }
#else
constexpr bool brotliEnabled() { return false; }
#endif

}  // namespace batchpress
