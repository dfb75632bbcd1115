#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/constant/transfer.h>
#include <core/network/server/transfer_session.h>
#include <core/protocol/handshake.h>
#include <core/security/file_hasher.h>
#include <core/util/transfer_error.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
namespace beast = boost::beast;

namespace ferry::core {

TransferSession::TransferSession(beast::tcp_stream stream, SessionContext& context)
    : stream_(std::move(stream))
    , context_(context)
    , id_(generateSessionId()) {
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    peer_address_ = ec ? std::string("unknown")
                       : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

net::awaitable<void> TransferSession::Run() {
    spdlog::info("Client {} connected.", peer_address_);

    std::fstream file;
    std::uint64_t offset = 0;
    try {
        request_ = co_await readHandshake();
        spdlog::info("Client {}: File Name: {}, File Size: {}, Resume: {}",
                     peer_address_,
                     request_.file_name,
                     request_.file_size,
                     request_.resume);

        offset = resolveOffset();
        file_path_ = context_.storage_dir / request_.file_name;
        file = openDestination(offset);

        co_await sendOffset(offset);
        spdlog::info("Client {}: Sent resume offset: {}", peer_address_, offset);
    } catch (const TransferError& e) {
        // The session never registered, the socket closes with this object
        spdlog::error("Client {}: {} ({})", peer_address_, e.what(), ToString(e.code()));
        co_return;
    }

    registerSession(offset);
    spdlog::info("Client {}: Started transferring file {} ({} bytes) from offset {}",
                 peer_address_,
                 request_.file_name,
                 request_.file_size,
                 offset);

    SessionStatus status = SessionStatus::kInterrupted;
    std::string computed_hash;
    try {
        status = co_await receivePayload(file);
        file.close();

        if (!IsTerminal(status)) {
            co_await readTrailer();
            status = verifyChecksum(computed_hash);
        }
    } catch (const std::exception& e) {
        spdlog::error("Client {}: Transfer of {} aborted: {}",
                      peer_address_,
                      request_.file_name,
                      e.what());
        status = SessionStatus::kInterrupted;
    }

    context_.registry.Complete(id_, status, computed_hash);
    context_.stats.ConnectionClosed();

    spdlog::info("Client {}: Session {} finished as {} ({} of {} bytes).",
                 peer_address_,
                 id_,
                 SessionStatusToString(status),
                 received_bytes_,
                 request_.file_size);
    spdlog::info("Client {}: Connection closed.", peer_address_);
}

net::awaitable<TransferRequest> TransferSession::readHandshake() {
    beast::error_code ec;

    handshake::LengthPrefix prefix{};
    armReadTimer();
    co_await net::async_read(stream_, net::buffer(prefix), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kReadFault,
                            "Error reading info length: " + ec.message());
    }
    std::uint32_t length = handshake::DecodeLength(prefix);

    std::string info(length, '\0');
    armReadTimer();
    co_await net::async_read(stream_, net::buffer(info), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kReadFault, "Error reading file info: " + ec.message());
    }

    co_return handshake::DecodeRequest(info);
}

net::awaitable<void> TransferSession::sendOffset(std::uint64_t offset) {
    std::string reply = handshake::EncodeOffset(offset);

    beast::error_code ec;
    co_await net::async_write(stream_, net::buffer(reply), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw TransferError(TransferErrc::kWriteFault,
                            "Error sending resume offset: " + ec.message());
    }
}

net::awaitable<SessionStatus> TransferSession::receivePayload(std::fstream& file) {
    std::uint64_t remaining = request_.file_size - received_bytes_;
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(transfer::kChunkSize, remaining)));

    auto last_read = std::chrono::steady_clock::now();
    while (received_bytes_ < request_.file_size) {
        // Never read past the payload: whatever follows it is the checksum trailer
        auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), request_.file_size - received_bytes_));

        beast::error_code ec;
        armReadTimer();
        std::size_t bytes_read = co_await stream_.async_read_some(
            net::buffer(buffer.data(), wanted), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::eof) {
                spdlog::info("Client {}: Connection closed at {} of {} bytes, resumable",
                             peer_address_,
                             received_bytes_,
                             request_.file_size);
            } else {
                spdlog::error("Client {}: Error reading file chunk: {}",
                              peer_address_,
                              ec.message());
            }
            co_return SessionStatus::kInterrupted;
        }

        file.write(buffer.data(), static_cast<std::streamsize>(bytes_read));
        file.flush();
        if (!file) {
            spdlog::error("Client {}: Error writing to file {}",
                          peer_address_,
                          file_path_.string());
            co_return SessionStatus::kWriteError;
        }

        received_bytes_ += bytes_read;
        context_.stats.AddBytes(bytes_read);
        context_.offset_store.Set(request_.file_name, received_bytes_);

        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_read).count();
        if (elapsed > 0.0) {
            double sample = static_cast<double>(bytes_read) / elapsed;
            speed_ = speed_ == 0.0 ? sample
                                   : transfer::kSpeedSmoothing * sample
                                         + (1.0 - transfer::kSpeedSmoothing) * speed_;
        }
        last_read = now;
        context_.registry.UpdateProgress(id_, received_bytes_, speed_);
    }

    co_return SessionStatus::kInProgress;
}

net::awaitable<void> TransferSession::readTrailer() {
    if (request_.source_hash.empty()) {
        co_return;
    }

    std::string trailer(request_.source_hash.size(), '\0');
    beast::error_code ec;
    armTrailerTimer();
    co_await net::async_read(stream_, net::buffer(trailer), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        spdlog::debug("Client {}: No complete checksum trailer: {}", peer_address_, ec.message());
        co_return;
    }
    if (!boost::algorithm::iequals(trailer, request_.source_hash)) {
        spdlog::warn("Client {}: Checksum trailer {} differs from the handshake checksum {}",
                     peer_address_,
                     trailer,
                     request_.source_hash);
    }
}

std::uint64_t TransferSession::resolveOffset() const {
    if (!request_.resume) {
        return 0;
    }
    auto stored = context_.offset_store.Get(request_.file_name);
    if (!stored) {
        return 0;
    }
    auto offset = handshake::ClampOffset(*stored, request_.file_size);
    if (offset != *stored) {
        spdlog::warn("Client {}: Stored offset {} exceeds file size {} for {}, restarting at 0",
                     peer_address_,
                     *stored,
                     request_.file_size,
                     request_.file_name);
    }
    return offset;
}

std::fstream TransferSession::openDestination(std::uint64_t offset) {
    // Open without truncation, creating the file first if needed
    std::fstream file(file_path_, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) {
        std::ofstream create(file_path_, std::ios::binary | std::ios::app);
        if (!create) {
            throw TransferError(TransferErrc::kStorageFault,
                                "Error creating file " + file_path_.string());
        }
        create.close();
        file.open(file_path_, std::ios::binary | std::ios::in | std::ios::out);
        if (!file) {
            throw TransferError(TransferErrc::kStorageFault,
                                "Error opening file " + file_path_.string());
        }
    }

    file.seekp(static_cast<std::streamoff>(offset));
    if (!file) {
        throw TransferError(TransferErrc::kStorageFault,
                            "Error seeking file " + file_path_.string() + " to offset "
                                + std::to_string(offset));
    }
    return file;
}

SessionStatus TransferSession::verifyChecksum(std::string& computed_hash) const {
    try {
        // The whole file, including bytes kept from earlier sessions
        computed_hash = FileHasher::CalculateFileChecksum(file_path_);
    } catch (const std::exception& e) {
        spdlog::error("Client {}: Error calculating file hash: {}", peer_address_, e.what());
        return SessionStatus::kHashError;
    }

    if (!boost::algorithm::iequals(computed_hash, request_.source_hash)) {
        spdlog::warn("Client {}: File {} checksum mismatch, expected {}, got {}. Received bytes "
                     "are kept.",
                     peer_address_,
                     request_.file_name,
                     request_.source_hash,
                     computed_hash);
        return SessionStatus::kHashError;
    }

    spdlog::info("Client {}: File {} received successfully ({} bytes). Hash: {}",
                 peer_address_,
                 request_.file_name,
                 received_bytes_,
                 computed_hash);
    return SessionStatus::kCompleted;
}

void TransferSession::registerSession(std::uint64_t offset) {
    received_bytes_ = offset;
    context_.registry.Add(SessionRecord{
        .id = id_,
        .peer_address = peer_address_,
        .file_name = request_.file_name,
        .file_size = request_.file_size,
        .received_bytes = offset,
        .status = SessionStatus::kInProgress,
        .speed = 0.0,
        .start_time = std::chrono::system_clock::now(),
        .source_hash = request_.source_hash,
        .computed_hash = {},
    });
    context_.stats.ConnectionOpened();
}

void TransferSession::armReadTimer() {
    if (context_.read_timeout.count() > 0) {
        stream_.expires_after(context_.read_timeout);
    } else {
        stream_.expires_never();
    }
}

// Always bounded, even without a read timeout: the payload is already on disk
void TransferSession::armTrailerTimer() {
    std::chrono::nanoseconds deadline = context_.trailer_timeout;
    if (context_.read_timeout.count() > 0 && context_.read_timeout < context_.trailer_timeout) {
        deadline = context_.read_timeout;
    }
    stream_.expires_after(deadline);
}

std::string TransferSession::generateSessionId() {
    boost::uuids::random_generator uuid_gen;
    std::string timestamp = std::to_string(
        std::chrono::system_clock::now().time_since_epoch().count());
    return timestamp + "-" + boost::uuids::to_string(uuid_gen());
}

} // namespace ferry::core
