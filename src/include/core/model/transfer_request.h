#pragma once

#include <cstdint>
#include <string>

namespace ferry::core {

// Handshake sent by the client: "file_name|file_size|source_hash|resume"
struct TransferRequest {
    std::string file_name;      // sanitized on the server before any filesystem use
    std::uint64_t file_size{0}; // total size of the source file
    std::string source_hash;    // hex SHA-256 of the whole source file
    bool resume{false};         // ask the server for the offset it already holds

    bool operator==(const TransferRequest&) const = default;
};

} // namespace ferry::core
