#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/model/session_record.h>
#include <core/network/server/session_registry.h>
#include <core/network/server/transfer_stats.h>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <vector>

namespace ferry::core {

struct StatusSnapshot {
    StatsSnapshot stats;
    std::vector<SessionRecord> active;
    std::vector<SessionRecord> completed;
};

void to_json(nlohmann::json& j, const StatusSnapshot& snapshot);

using StatusCallback = std::function<void(const StatusSnapshot&)>;

// Periodically samples the registry and the counters. Read-only with respect to both.
class StatusReporter {
public:
    StatusReporter(boost::asio::io_context& io_context,
                   const SessionRegistry& registry,
                   const TransferStats& stats,
                   std::chrono::milliseconds interval,
                   StatusCallback callback = nullptr,
                   std::filesystem::path status_file = {});
    ~StatusReporter();
    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    void Start();
    void Stop();

    StatusSnapshot Collect() const;

    // Never below 1 ms, whatever was configured
    std::chrono::milliseconds interval() const { return interval_; }

    // Writes the snapshot as JSON next to the target, then renames it into place
    void WriteStatusFile(const StatusSnapshot& snapshot) const;

private:
    boost::asio::awaitable<void> reportLoop();
    void report();

    boost::asio::io_context& io_context_;
    const SessionRegistry& registry_;
    const TransferStats& stats_;
    std::chrono::milliseconds interval_;
    StatusCallback callback_;
    std::filesystem::path status_file_;
    boost::asio::steady_timer timer_;
    bool running_;
};

} // namespace ferry::core
