#include <algorithm>
#include <core/network/server/session_registry.h>
#include <spdlog/spdlog.h>

namespace ferry::core {

void SessionRegistry::Add(SessionRecord record) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    auto id = record.id;
    active_.insert_or_assign(std::move(id), std::move(record));
}

void SessionRegistry::UpdateProgress(const std::string& id,
                                     std::uint64_t received_bytes,
                                     double speed) {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (auto it = active_.find(id); it != active_.end()) {
        it->second.received_bytes = received_bytes;
        it->second.speed = speed;
    }
}

bool SessionRegistry::Complete(const std::string& id,
                               SessionStatus status,
                               std::string computed_hash) {
    std::scoped_lock lock(active_mutex_, completed_mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        spdlog::warn("Session {} is not active, cannot complete it", id);
        return false;
    }
    SessionRecord record = std::move(it->second);
    active_.erase(it);

    record.status = status;
    record.computed_hash = std::move(computed_hash);
    completed_.push_back(std::move(record));
    return true;
}

std::optional<SessionRecord> SessionRegistry::Find(const std::string& id) const {
    std::scoped_lock lock(active_mutex_, completed_mutex_);
    if (auto it = active_.find(id); it != active_.end()) {
        return it->second;
    }
    auto it = std::find_if(completed_.begin(), completed_.end(), [&](const SessionRecord& r) {
        return r.id == id;
    });
    if (it != completed_.end()) {
        return *it;
    }
    return std::nullopt;
}

std::vector<SessionRecord> SessionRegistry::ActiveSessions() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    std::vector<SessionRecord> sessions;
    sessions.reserve(active_.size());
    for (const auto& [_, record] : active_) {
        sessions.push_back(record);
    }
    std::sort(sessions.begin(), sessions.end(), [](const auto& a, const auto& b) {
        return a.start_time < b.start_time;
    });
    return sessions;
}

std::vector<SessionRecord> SessionRegistry::CompletedSessions() const {
    std::lock_guard<std::mutex> lock(completed_mutex_);
    return completed_;
}

RegistrySnapshot SessionRegistry::Snapshot() const {
    RegistrySnapshot snapshot;
    std::scoped_lock lock(active_mutex_, completed_mutex_);
    snapshot.active.reserve(active_.size());
    for (const auto& [_, record] : active_) {
        snapshot.active.push_back(record);
    }
    std::sort(snapshot.active.begin(), snapshot.active.end(), [](const auto& a, const auto& b) {
        return a.start_time < b.start_time;
    });
    snapshot.completed = completed_;
    return snapshot;
}

std::size_t SessionRegistry::ActiveCount() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_.size();
}

} // namespace ferry::core
