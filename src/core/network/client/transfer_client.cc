#include <core/network/client/transfer_client.h>
#include <core/protocol/handshake.h>
#include <spdlog/spdlog.h>

namespace ferry::core {

namespace net = boost::asio;

TransferClient::TransferClient(net::io_context& io_context,
                               ClientOptions options,
                               RetryController::DelayFunc delay)
    : io_context_(io_context)
    , options_(std::move(options))
    , retry_(options_.retry, std::move(delay)) {}

net::awaitable<TransferResult> TransferClient::SendFile(const std::filesystem::path& file_path) {
    spdlog::info("Sending {} to {}:{}", file_path.string(), options_.host, options_.port);

    // A name the handshake cannot carry fails the same way on every attempt
    handshake::ValidateFileName(TransferDriver::RemoteName(options_, file_path));

    TransferDriver driver(io_context_, options_);
    TransferResult result;
    int attempts = co_await retry_.Run([&](int attempt) -> net::awaitable<void> {
        spdlog::debug("Starting attempt {}/{}", attempt, retry_.policy().max_attempts);
        result = co_await driver.Run(file_path);
    });

    result.attempts = attempts;
    spdlog::info("File {} transferred after {} attempt(s)", file_path.string(), attempts);
    co_return result;
}

} // namespace ferry::core
