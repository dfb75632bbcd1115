#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

namespace ferry::core {

enum class SessionStatus {
    kInProgress,  // receiving payload
    kCompleted,   // all bytes received, digest matches
    kInterrupted, // peer went away before file_size bytes arrived
    kWriteError,  // destination file rejected a write
    kHashError,   // all bytes received but the digest differs or could not be computed
};

NLOHMANN_JSON_SERIALIZE_ENUM(SessionStatus,
                             {
                                 {SessionStatus::kInProgress, "in-progress"},
                                 {SessionStatus::kCompleted, "completed"},
                                 {SessionStatus::kInterrupted, "interrupted"},
                                 {SessionStatus::kWriteError, "write-error"},
                                 {SessionStatus::kHashError, "hash-error"},
                             });

constexpr std::string_view SessionStatusToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::kInProgress:
        return "in-progress";
    case SessionStatus::kCompleted:
        return "completed";
    case SessionStatus::kInterrupted:
        return "interrupted";
    case SessionStatus::kWriteError:
        return "write-error";
    case SessionStatus::kHashError:
        return "hash-error";
    }
    return "unknown";
}

constexpr bool IsTerminal(SessionStatus status) {
    return status != SessionStatus::kInProgress;
}

} // namespace ferry::core
