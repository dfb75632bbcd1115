#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/transfer_request.h>
#include <core/network/client/retry_controller.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace ferry::core {

// (bytes the server holds so far, file size)
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

struct ClientOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = transfer::kDefaultPort;
    bool resume = true;
    std::chrono::seconds connect_timeout{transfer::kDefaultConnectTimeoutSeconds};
    std::chrono::seconds io_timeout{0}; // 0 waits forever
    std::string remote_name;            // empty sends the local file name
    RetryPolicy retry;
    ProgressCallback on_progress;
};

struct TransferResult {
    std::uint64_t offset = 0;     // negotiated with the server
    std::uint64_t bytes_sent = 0; // payload bytes written by this attempt
    std::uint64_t file_size = 0;
    std::string checksum;
    int attempts = 1;
};

// One attempt of the protocol: connect, handshake, stream from the offset, trailer.
// Any fault throws TransferError and leaves retrying to the caller.
class TransferDriver {
public:
    TransferDriver(boost::asio::io_context& io_context, const ClientOptions& options);

    boost::asio::awaitable<TransferResult> Run(const std::filesystem::path& file_path);

    // The name announced in the handshake: remote_name, or the local base name
    static std::string RemoteName(const ClientOptions& options,
                                  const std::filesystem::path& file_path);

private:
    boost::asio::awaitable<void> connect(boost::beast::tcp_stream& stream);

    boost::asio::awaitable<std::uint64_t> negotiateOffset(boost::beast::tcp_stream& stream,
                                                          const std::vector<std::uint8_t>& frame);

    boost::asio::awaitable<std::uint64_t> streamPayload(boost::beast::tcp_stream& stream,
                                                        std::ifstream& file,
                                                        std::uint64_t offset,
                                                        std::uint64_t file_size);

    boost::asio::awaitable<void> sendTrailer(boost::beast::tcp_stream& stream,
                                             const std::string& checksum);

    void armTimer(boost::beast::tcp_stream& stream);

    boost::asio::io_context& io_context_;
    const ClientOptions& options_;
};

} // namespace ferry::core
