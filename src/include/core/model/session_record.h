#pragma once

#include "session_status.h"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace ferry::core {

struct SessionRecord {
    std::string id;                                   // timestamp + uuid, unique per connection
    std::string peer_address;                         // ip:port of the uploader
    std::string file_name;                            // sanitized destination name
    std::uint64_t file_size{0};                       // declared by the handshake
    std::uint64_t received_bytes{0};                  // starts at the negotiated offset
    SessionStatus status{SessionStatus::kInProgress};
    double speed{0.0};                                // smoothed, bytes per second
    std::chrono::system_clock::time_point start_time;
    std::string source_hash;                          // declared by the client
    std::string computed_hash;                        // filled on finalization
};

inline void to_json(nlohmann::json& j, const SessionRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"peer_address", record.peer_address},
        {"file_name", record.file_name},
        {"file_size", record.file_size},
        {"received_bytes", record.received_bytes},
        {"status", record.status},
        {"speed", record.speed},
        {"start_time",
         std::chrono::duration_cast<std::chrono::milliseconds>(
             record.start_time.time_since_epoch())
             .count()},
        {"source_hash", record.source_hash},
        {"computed_hash", record.computed_hash},
    };
}

} // namespace ferry::core
