#pragma once

#include <cstddef>
#include <cstdint>

namespace ferry::core {

namespace transfer {

constexpr std::uint16_t kDefaultPort = 59999;

constexpr std::size_t kChunkSize = 4 * 1024 * 1024;      // 4 MB per socket read / file write
constexpr std::size_t kMaxHandshakeLength = 64 * 1024;   // upper bound for the info frame
constexpr std::size_t kHandshakeLengthPrefixSize = 4;    // big-endian uint32
constexpr std::size_t kOffsetAckBufferSize = 256;        // bounded read of the offset reply

constexpr char kFieldDelimiter = '|';

constexpr int kDefaultMaxAttempts = 5;
constexpr unsigned int kDefaultRetryIntervalMs = 2000;
constexpr unsigned int kDefaultConnectTimeoutSeconds = 10;
constexpr unsigned int kDefaultStatusIntervalMs = 500;

// How long the server waits for the checksum trailer once the payload is complete
constexpr unsigned int kDefaultTrailerTimeoutMs = 5000;

// Weight of the newest sample in the per-session speed average
constexpr double kSpeedSmoothing = 0.25;

} // namespace transfer

} // namespace ferry::core
