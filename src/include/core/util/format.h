#pragma once

#include <cstdint>
#include <string>

namespace ferry::core {

// 1536 -> "1.50 KB", 512 -> "512 B"
std::string FormatBytes(std::uint64_t bytes);

// Bytes per second rendered through FormatBytes with a "/s" suffix
std::string FormatSpeed(double bytes_per_second);

} // namespace ferry::core
