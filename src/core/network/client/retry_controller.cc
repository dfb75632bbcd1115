#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/client/retry_controller.h>
#include <core/util/transfer_error.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace net = boost::asio;

namespace ferry::core {

RetryController::RetryController(RetryPolicy policy, DelayFunc delay)
    : policy_(policy)
    , delay_(delay ? std::move(delay) : DelayFunc(&RetryController::timerDelay)) {}

net::awaitable<int> RetryController::Run(AttemptFunc attempt) {
    const int max_attempts = std::max(1, policy_.max_attempts);

    for (int i = 1; i <= max_attempts; ++i) {
        std::string cause;
        try {
            co_await attempt(i);
            co_return i;
        } catch (const std::exception& e) {
            cause = e.what();
        }

        if (i == max_attempts) {
            spdlog::error("Attempt {}/{} failed: {}", i, max_attempts, cause);
            break;
        }
        spdlog::warn("Attempt {}/{} failed: {}. Retrying in {} ms...",
                     i,
                     max_attempts,
                     cause,
                     policy_.interval.count());
        co_await delay_(policy_.interval);
    }

    throw TransferError(TransferErrc::kRetriesExhausted,
                        fmt::format("all {} attempts failed", max_attempts));
}

net::awaitable<void> RetryController::timerDelay(std::chrono::milliseconds interval) {
    net::steady_timer timer(co_await net::this_coro::executor, interval);
    co_await timer.async_wait(net::use_awaitable);
}

} // namespace ferry::core
