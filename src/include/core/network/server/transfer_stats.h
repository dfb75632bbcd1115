#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace ferry::core {

struct StatsSnapshot {
    std::int64_t active_connections{0};
    std::uint64_t total_bytes{0};
    std::chrono::steady_clock::duration uptime{};

    // Average throughput since the server started, bytes per second
    double AverageSpeed() const;
};

// Process-wide counters read by the status reporter. Eventually consistent, never used
// for protocol decisions.
class TransferStats {
public:
    TransferStats();
    TransferStats(const TransferStats&) = delete;
    TransferStats& operator=(const TransferStats&) = delete;

    void ConnectionOpened();
    void ConnectionClosed();
    void AddBytes(std::uint64_t bytes);

    StatsSnapshot Snapshot() const;

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point start_time_;
    std::int64_t active_connections_{0};
    std::uint64_t total_bytes_{0};
};

} // namespace ferry::core
