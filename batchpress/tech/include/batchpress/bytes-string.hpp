#pragma once

#include <cstdint>
#include <string>

#include "batchpress/raw-chars.hpp"

namespace batchpress {

// Append a human-readable size using binary units (B, KiB, MiB, GiB, TiB, PiB, EiB).
//  - Values below 1024 are printed as an integer number of bytes: "512 B".
//  - Otherwise the largest unit keeping the value below 1024 is chosen. One decimal is printed
//    when the value is below 10 ("1.5 KiB", "1.0 MiB"), none otherwise ("12 MiB").
//  - A single space separates the number and the unit.
void AddFormattedSize(std::uintmax_t size, RawChars& out);

// Same as AddFormattedSize, returned as a new string.
std::string FormattedSize(std::uintmax_t size);

}  // namespace batchpress
