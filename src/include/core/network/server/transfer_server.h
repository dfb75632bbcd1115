#pragma once

#include <atomic>
#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/network/server/offset_store.h>
#include <core/network/server/session_registry.h>
#include <core/network/server/transfer_session.h>
#include <core/network/server/transfer_stats.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry::core {

struct ServerOptions {
    std::string listen_address = "0.0.0.0";
    std::uint16_t port = 0;                 // 0 binds an ephemeral port
    std::filesystem::path storage_dir;
    std::chrono::seconds read_timeout{0};   // 0 waits forever
    std::chrono::milliseconds trailer_timeout{transfer::kDefaultTrailerTimeoutMs};
    std::size_t max_sessions = 0;           // 0 is unbounded
};

// TCP server that runs one TransferSession per accepted connection
class TransferServer {
public:
    TransferServer(boost::asio::io_context& io_context, ServerOptions options);
    ~TransferServer();
    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Binds and starts accepting. Throws if the endpoint cannot be bound.
    void Start();

    void Stop();

    bool running() const { return running_; }
    std::uint16_t port() const { return port_; }
    const ServerOptions& options() const { return options_; }

    OffsetStore& offset_store() { return offset_store_; }
    SessionRegistry& registry() { return registry_; }
    TransferStats& stats() { return stats_; }

private:
    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleConnection(boost::beast::tcp_stream stream);

    boost::asio::io_context& io_context_;
    ServerOptions options_;
    boost::asio::ip::tcp::acceptor acceptor_;
    bool running_;
    std::uint16_t port_;
    std::atomic<std::size_t> open_connections_;

    OffsetStore offset_store_;
    SessionRegistry registry_;
    TransferStats stats_;
    SessionContext context_;
};

} // namespace ferry::core
