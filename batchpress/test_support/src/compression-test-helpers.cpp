#include "batchpress/compression-test-helpers.hpp"

#include <algorithm>
#include <cstddef>
#include <random>
#include <string>
#include <string_view>

namespace batchpress::test {

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.resize_and_overwrite(size, [](char* data, std::size_t sz) {
    for (std::size_t pos = 0; pos < sz; ++pos) {
      data[pos] = static_cast<char>(static_cast<unsigned char>(pos));
    }
    return sz;
  });
  return payload;
}

std::string MakeRandomPayload(std::size_t size) {
  std::string payload(size, '\0');
  std::mt19937_64 rng{123456789ULL};
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto& ch : payload) {
    ch = static_cast<char>(dist(rng));
  }
  return payload;
}

std::string MakeTextPayload(std::size_t size) {
  static constexpr std::string_view kChunk =
      "body { margin: 0; padding: 0; font-family: sans-serif; }\n"
      ".header { color: #333; background: #fafafa; border-bottom: 1px solid #ddd; }\n";
  std::string payload;
  payload.reserve(size);
  while (payload.size() < size) {
    payload.append(kChunk.substr(0, std::min(kChunk.size(), size - payload.size())));
  }
  return payload;
}

}  // namespace batchpress::test
