#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/network/client/retry_controller.h>
#include <core/network/client/transfer_driver.h>
#include <filesystem>

namespace ferry::core {

// Sends one file, re-driving TransferDriver under a RetryController
class TransferClient {
public:
    TransferClient(boost::asio::io_context& io_context,
                   ClientOptions options,
                   RetryController::DelayFunc delay = nullptr);

    // Throws TransferError(kRetriesExhausted) when no attempt succeeded, or
    // TransferError(kMalformedHandshake) up front for a name the handshake cannot carry
    boost::asio::awaitable<TransferResult> SendFile(const std::filesystem::path& file_path);

    const ClientOptions& options() const { return options_; }

private:
    boost::asio::io_context& io_context_;
    ClientOptions options_;
    RetryController retry_;
};

} // namespace ferry::core
