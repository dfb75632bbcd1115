#pragma once

#include <core/model/session_record.h>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::core {

struct RegistrySnapshot {
    std::vector<SessionRecord> active;
    std::vector<SessionRecord> completed;
};

// In-flight and finished sessions, for observability only.
// Anything touching both collections takes both mutexes together through std::scoped_lock,
// so a record is never visible in both of them or in neither.
class SessionRegistry {
public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    void Add(SessionRecord record);

    void UpdateProgress(const std::string& id, std::uint64_t received_bytes, double speed);

    // Moves the record from the active map to the completed list in one step.
    // Returns false if the id is not active.
    bool Complete(const std::string& id, SessionStatus status, std::string computed_hash = {});

    std::optional<SessionRecord> Find(const std::string& id) const;

    std::vector<SessionRecord> ActiveSessions() const;
    std::vector<SessionRecord> CompletedSessions() const;
    RegistrySnapshot Snapshot() const;

    std::size_t ActiveCount() const;

private:
    mutable std::mutex active_mutex_;
    mutable std::mutex completed_mutex_;
    std::unordered_map<std::string, SessionRecord> active_;
    std::vector<SessionRecord> completed_;
};

} // namespace ferry::core
