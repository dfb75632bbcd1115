/*
    handshake.h
    Wire format shared by client and server.

    client -> server   uint32 big-endian length L, then L bytes "name|size|hash|resume"
    server -> client   decimal ASCII resume offset, no delimiter, no length prefix
    client -> server   raw file bytes from the offset, then the raw hex digest as trailer

    The server knows where the payload ends only from the size in the handshake.
*/

#pragma once

#include <array>
#include <core/constant/transfer.h>
#include <core/model/transfer_request.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core::handshake {

using LengthPrefix = std::array<std::uint8_t, transfer::kHandshakeLengthPrefixSize>;

// Throws TransferError(kMalformedHandshake) for a name that cannot travel in the
// delimited handshake: empty, or containing the field delimiter
void ValidateFileName(std::string_view file_name);

// Throws TransferError(kMalformedHandshake) when ValidateFileName rejects file_name
std::string EncodeRequest(const TransferRequest& request);

// Length prefix followed by the encoded request, ready to be written in one go
std::vector<std::uint8_t> FrameRequest(const TransferRequest& request);

// Throws TransferError(kMalformedHandshake) for 0 or anything above kMaxHandshakeLength
std::uint32_t DecodeLength(const LengthPrefix& prefix);

// Throws TransferError(kMalformedHandshake); the returned file_name is already sanitized
TransferRequest DecodeRequest(std::string_view info);

// Reduces an untrusted name to a bare base name: no separators, no "..", no NUL
std::string SanitizeFileName(std::string_view file_name);

std::string EncodeOffset(std::uint64_t offset);

// Trims surrounding whitespace; throws TransferError(kInvalidOffsetAck)
std::uint64_t DecodeOffset(std::string_view reply);

// An offset past the end of the file is stale state from some other upload
constexpr std::uint64_t ClampOffset(std::uint64_t offset, std::uint64_t file_size) {
    return offset > file_size ? 0 : offset;
}

} // namespace ferry::core::handshake
