#include <core/network/server/transfer_stats.h>

namespace ferry::core {

double StatsSnapshot::AverageSpeed() const {
    double seconds = std::chrono::duration<double>(uptime).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(total_bytes) / seconds;
}

TransferStats::TransferStats()
    : start_time_(std::chrono::steady_clock::now()) {}

void TransferStats::ConnectionOpened() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_connections_;
}

void TransferStats::ConnectionClosed() {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_connections_;
}

void TransferStats::AddBytes(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ += bytes;
}

StatsSnapshot TransferStats::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StatsSnapshot{
        .active_connections = active_connections_,
        .total_bytes = total_bytes_,
        .uptime = std::chrono::steady_clock::now() - start_time_,
    };
}

} // namespace ferry::core
