#pragma once

#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <functional>

namespace ferry::core {

struct RetryPolicy {
    int max_attempts = transfer::kDefaultMaxAttempts;
    std::chrono::milliseconds interval{transfer::kDefaultRetryIntervalMs};
};

// Re-drives a whole attempt with a flat interval between failures. The attempt itself never
// retries; a failed attempt is any std::exception escaping it.
class RetryController {
public:
    using AttemptFunc = std::function<boost::asio::awaitable<void>(int attempt)>;
    using DelayFunc = std::function<boost::asio::awaitable<void>(std::chrono::milliseconds)>;

    // Without a delay function the controller waits on a steady_timer
    explicit RetryController(RetryPolicy policy, DelayFunc delay = nullptr);

    // Returns the number of the attempt that succeeded.
    // Throws TransferError(kRetriesExhausted) once every attempt failed.
    boost::asio::awaitable<int> Run(AttemptFunc attempt);

    const RetryPolicy& policy() const { return policy_; }

private:
    static boost::asio::awaitable<void> timerDelay(std::chrono::milliseconds interval);

    RetryPolicy policy_;
    DelayFunc delay_;
};

} // namespace ferry::core
