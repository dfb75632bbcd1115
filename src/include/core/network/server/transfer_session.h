#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/session_status.h>
#include <core/model/transfer_request.h>
#include <core/network/server/offset_store.h>
#include <core/network/server/session_registry.h>
#include <core/network/server/transfer_stats.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace ferry::core {

// Everything a session shares with the server and with its sibling sessions
struct SessionContext {
    std::filesystem::path storage_dir;
    std::chrono::seconds read_timeout{0}; // 0 waits forever
    std::chrono::milliseconds trailer_timeout{transfer::kDefaultTrailerTimeoutMs};
    OffsetStore& offset_store;
    SessionRegistry& registry;
    TransferStats& stats;
};

// Drives one accepted connection: handshake, receive loop, trailer, checksum.
// Faults end this session only; nothing is reported to the peer besides closing the socket.
class TransferSession {
public:
    TransferSession(boost::beast::tcp_stream stream, SessionContext& context);
    ~TransferSession() = default;
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    boost::asio::awaitable<void> Run();

    const std::string& id() const { return id_; }
    const std::string& peer_address() const { return peer_address_; }

private:
    boost::asio::awaitable<TransferRequest> readHandshake();
    boost::asio::awaitable<void> sendOffset(std::uint64_t offset);

    // Returns kInProgress once file_size bytes are on disk, a terminal status otherwise
    boost::asio::awaitable<SessionStatus> receivePayload(std::fstream& file);

    boost::asio::awaitable<void> readTrailer();

    std::uint64_t resolveOffset() const;
    std::fstream openDestination(std::uint64_t offset);
    SessionStatus verifyChecksum(std::string& computed_hash) const;
    void registerSession(std::uint64_t offset);
    void armReadTimer();
    void armTrailerTimer();

    static std::string generateSessionId();

    boost::beast::tcp_stream stream_;
    SessionContext& context_;
    std::string peer_address_;
    std::string id_;
    TransferRequest request_{};
    std::filesystem::path file_path_;
    std::uint64_t received_bytes_{0};
    double speed_{0.0};
};

} // namespace ferry::core
