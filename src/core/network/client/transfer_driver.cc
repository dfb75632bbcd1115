#include <algorithm>
#include <array>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <core/network/client/transfer_driver.h>
#include <core/protocol/handshake.h>
#include <core/security/file_hasher.h>
#include <core/util/transfer_error.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace ferry::core {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace fs = std::filesystem;
using tcp = net::ip::tcp;

TransferDriver::TransferDriver(net::io_context& io_context, const ClientOptions& options)
    : io_context_(io_context)
    , options_(options) {}

net::awaitable<TransferResult> TransferDriver::Run(const fs::path& file_path) {
    std::error_code fs_ec;
    auto file_size = fs::file_size(file_path, fs_ec);
    if (fs_ec) {
        throw TransferError(TransferErrc::kReadFault,
                            "Error getting file info for " + file_path.string() + ": "
                                + fs_ec.message());
    }

    std::string checksum;
    try {
        checksum = FileHasher::CalculateFileChecksum(file_path);
    } catch (const std::exception& e) {
        throw TransferError(TransferErrc::kReadFault,
                            std::string("Error calculating file hash: ") + e.what());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw TransferError(TransferErrc::kReadFault, "Error opening file " + file_path.string());
    }

    TransferRequest request{
        .file_name = RemoteName(options_, file_path),
        .file_size = file_size,
        .source_hash = checksum,
        .resume = options_.resume,
    };
    // Framed before dialing so an unencodable name never reaches the server
    auto frame = handshake::FrameRequest(request);

    beast::tcp_stream stream(io_context_);
    co_await connect(stream);

    auto offset = co_await negotiateOffset(stream, frame);
    if (offset > file_size) {
        spdlog::warn("Server offset {} exceeds file size {}, starting from 0", offset, file_size);
        offset = 0;
    }
    spdlog::info("Resuming {} from offset {} of {}", request.file_name, offset, file_size);

    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        throw TransferError(TransferErrc::kReadFault,
                            "Error seeking file to offset " + std::to_string(offset));
    }

    auto bytes_sent = co_await streamPayload(stream, file, offset, file_size);
    co_await sendTrailer(stream, checksum);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec) {
        spdlog::debug("Shutdown notice: {}", ec.message());
    }

    spdlog::info("Sent {} bytes of {} and checksum {}", bytes_sent, request.file_name, checksum);
    co_return TransferResult{
        .offset = offset,
        .bytes_sent = bytes_sent,
        .file_size = file_size,
        .checksum = checksum,
    };
}

std::string TransferDriver::RemoteName(const ClientOptions& options, const fs::path& file_path) {
    return options.remote_name.empty() ? file_path.filename().string() : options.remote_name;
}

net::awaitable<void> TransferDriver::connect(beast::tcp_stream& stream) {
    beast::error_code ec;

    tcp::resolver resolver(io_context_);
    auto results = co_await resolver.async_resolve(options_.host,
                                                   std::to_string(options_.port),
                                                   net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kConnectFailure,
                            "Error resolving " + options_.host + ": " + ec.message());
    }

    stream.expires_after(options_.connect_timeout);
    co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    stream.expires_never();
    if (ec) {
        throw TransferError(TransferErrc::kConnectFailure,
                            "Error connecting to " + options_.host + ":"
                                + std::to_string(options_.port) + ": " + ec.message());
    }

    spdlog::info("Connected to {}:{}", options_.host, options_.port);
}

net::awaitable<std::uint64_t> TransferDriver::negotiateOffset(
    beast::tcp_stream& stream, const std::vector<std::uint8_t>& frame) {
    beast::error_code ec;

    armTimer(stream);
    co_await net::async_write(stream, net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kWriteFault, "Error sending file info: " + ec.message());
    }

    std::array<char, transfer::kOffsetAckBufferSize> reply{};
    armTimer(stream);
    std::size_t n = co_await stream.async_read_some(net::buffer(reply),
                                                    net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kReadFault,
                            "Error reading resume offset: " + ec.message());
    }

    co_return handshake::DecodeOffset(std::string_view(reply.data(), n));
}

net::awaitable<std::uint64_t> TransferDriver::streamPayload(beast::tcp_stream& stream,
                                                            std::ifstream& file,
                                                            std::uint64_t offset,
                                                            std::uint64_t file_size) {
    const std::uint64_t remaining = file_size - offset;
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(transfer::kChunkSize, remaining)));

    std::uint64_t sent = 0;
    while (sent < remaining) {
        auto wanted = static_cast<std::streamsize>(
            std::min<std::uint64_t>(buffer.size(), remaining - sent));
        file.read(buffer.data(), wanted);
        auto bytes_read = file.gcount();
        if (bytes_read <= 0) {
            throw TransferError(TransferErrc::kReadFault,
                                "Error reading file chunk at offset "
                                    + std::to_string(offset + sent));
        }

        beast::error_code ec;
        armTimer(stream);
        co_await net::async_write(stream,
                                  net::buffer(buffer.data(), static_cast<std::size_t>(bytes_read)),
                                  net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw TransferError(TransferErrc::kWriteFault,
                                "Error sending file chunk: " + ec.message());
        }

        sent += static_cast<std::uint64_t>(bytes_read);
        if (options_.on_progress) {
            options_.on_progress(offset + sent, file_size);
        }
    }

    co_return sent;
}

net::awaitable<void> TransferDriver::sendTrailer(beast::tcp_stream& stream,
                                                 const std::string& checksum) {
    beast::error_code ec;
    armTimer(stream);
    co_await net::async_write(stream, net::buffer(checksum), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kWriteFault, "Error sending file hash: " + ec.message());
    }
}

void TransferDriver::armTimer(beast::tcp_stream& stream) {
    if (options_.io_timeout.count() > 0) {
        stream.expires_after(options_.io_timeout);
    } else {
        stream.expires_never();
    }
}

} // namespace ferry::core
