#include "batchpress/random-hex.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <thread>

namespace batchpress {

namespace {

std::mt19937_64 &ThreadRng() {
  thread_local std::mt19937_64 engine = [] {
    // Mix several entropy sources, std::random_device may be deterministic on some platforms.
    std::random_device rd;
    const auto now = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    const auto addr = reinterpret_cast<std::uint64_t>(&rd);
    std::array<std::uint64_t, 4> seeds{static_cast<std::uint64_t>(rd()), now, tid, addr};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

std::string ToHex(std::uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int pos = 15; pos >= 0; --pos) {
    out[static_cast<std::string::size_type>(pos)] = kHex[value & 0xF];
    value >>= 4;
  }
  return out;
}

std::string RandomHexString() {
  std::uniform_int_distribution<std::uint64_t> dist;
  return ToHex(dist(ThreadRng()));
}

}  // namespace batchpress
