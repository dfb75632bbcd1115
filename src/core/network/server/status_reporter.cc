#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/server/status_reporter.h>
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>

namespace ferry::core {

namespace net = boost::asio;

void to_json(nlohmann::json& j, const StatusSnapshot& snapshot) {
    j = nlohmann::json{
        {"active_connections", snapshot.stats.active_connections},
        {"total_bytes", snapshot.stats.total_bytes},
        {"uptime_ms",
         std::chrono::duration_cast<std::chrono::milliseconds>(snapshot.stats.uptime).count()},
        {"average_speed", snapshot.stats.AverageSpeed()},
        {"active", snapshot.active},
        {"completed", snapshot.completed},
    };
}

StatusReporter::StatusReporter(net::io_context& io_context,
                               const SessionRegistry& registry,
                               const TransferStats& stats,
                               std::chrono::milliseconds interval,
                               StatusCallback callback,
                               std::filesystem::path status_file)
    : io_context_(io_context)
    , registry_(registry)
    , stats_(stats)
    , interval_(std::max(interval, std::chrono::milliseconds(1)))
    , callback_(std::move(callback))
    , status_file_(std::move(status_file))
    , timer_(io_context)
    , running_(false) {}

StatusReporter::~StatusReporter() {
    Stop();
}

void StatusReporter::Start() {
    if (running_) {
        return;
    }
    running_ = true;
    net::co_spawn(io_context_, reportLoop(), net::detached);
}

void StatusReporter::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_.cancel();
}

StatusSnapshot StatusReporter::Collect() const {
    auto sessions = registry_.Snapshot();
    return StatusSnapshot{
        .stats = stats_.Snapshot(),
        .active = std::move(sessions.active),
        .completed = std::move(sessions.completed),
    };
}

void StatusReporter::WriteStatusFile(const StatusSnapshot& snapshot) const {
    if (status_file_.empty()) {
        return;
    }

    auto tmp_path = status_file_;
    tmp_path += ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs.is_open()) {
            spdlog::error("Failed to open \"{}\" for writing status.", tmp_path.string());
            return;
        }
        ofs << nlohmann::json(snapshot).dump(2);
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, status_file_, ec);
    if (ec) {
        spdlog::error("Failed to move status file into \"{}\": {}",
                      status_file_.string(),
                      ec.message());
    }
}

net::awaitable<void> StatusReporter::reportLoop() {
    while (running_) {
        timer_.expires_after(interval_);
        boost::system::error_code ec;
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec == net::error::operation_aborted || !running_) {
            break;
        }
        report();
    }
    spdlog::debug("Status reporter stopped.");
}

void StatusReporter::report() {
    try {
        auto snapshot = Collect();
        if (callback_) {
            callback_(snapshot);
        }
        WriteStatusFile(snapshot);
    } catch (const std::exception& e) {
        spdlog::error("Failed to report status: {}", e.what());
    }
}

} // namespace ferry::core
