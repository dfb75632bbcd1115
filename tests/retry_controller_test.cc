#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <core/network/client/retry_controller.h>
#include <core/util/transfer_error.h>
#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace ferry::core;
namespace net = boost::asio;

namespace {

// Runs the controller to completion on a private io_context
int RunController(RetryController& controller, RetryController::AttemptFunc attempt) {
    net::io_context io_context;
    std::optional<int> result;
    std::exception_ptr error;
    net::co_spawn(io_context,
                  controller.Run(std::move(attempt)),
                  [&](std::exception_ptr e, int value) {
                      error = e;
                      if (!e) {
                          result = value;
                      }
                  });
    io_context.run();
    if (error) {
        std::rethrow_exception(error);
    }
    return *result;
}

class RetryControllerTest : public ::testing::Test {
protected:
    RetryController MakeController(int max_attempts) {
        RetryPolicy policy{.max_attempts = max_attempts, .interval = std::chrono::milliseconds(2000)};
        return RetryController(policy, [this](std::chrono::milliseconds interval) -> net::awaitable<void> {
            delays_.push_back(interval);
            co_return;
        });
    }

    std::vector<std::chrono::milliseconds> delays_;
};

} // namespace

TEST_F(RetryControllerTest, FirstAttemptSucceeds) {
    auto controller = MakeController(5);
    int calls = 0;
    int attempt = RunController(controller, [&](int) -> net::awaitable<void> {
        ++calls;
        co_return;
    });

    EXPECT_EQ(attempt, 1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays_.empty());
}

TEST_F(RetryControllerTest, SucceedsOnTheLastAttempt) {
    auto controller = MakeController(5);
    std::vector<int> seen;
    int attempt = RunController(controller, [&](int i) -> net::awaitable<void> {
        seen.push_back(i);
        if (i < 5) {
            throw TransferError(TransferErrc::kConnectFailure, "connection refused");
        }
        co_return;
    });

    EXPECT_EQ(attempt, 5);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 4, 5}));
    ASSERT_EQ(delays_.size(), 4u);
    for (auto delay : delays_) {
        EXPECT_EQ(delay, std::chrono::milliseconds(2000));
    }
}

TEST_F(RetryControllerTest, FailsAfterExactlyMaxAttemptsAndOneFewerDelays) {
    auto controller = MakeController(5);
    int calls = 0;
    try {
        RunController(controller, [&](int) -> net::awaitable<void> {
            ++calls;
            throw TransferError(TransferErrc::kReadFault, "connection reset");
            co_return;
        });
        FAIL() << "expected the retries to run out";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::kRetriesExhausted);
        EXPECT_STREQ(e.what(), "all 5 attempts failed");
    }

    EXPECT_EQ(calls, 5);
    EXPECT_EQ(delays_.size(), 4u);
}

TEST_F(RetryControllerTest, AnyStandardExceptionCountsAsAFailedAttempt) {
    auto controller = MakeController(3);
    int attempt = RunController(controller, [&](int i) -> net::awaitable<void> {
        if (i == 1) {
            throw std::runtime_error("disk hiccup");
        }
        co_return;
    });

    EXPECT_EQ(attempt, 2);
    EXPECT_EQ(delays_.size(), 1u);
}

TEST_F(RetryControllerTest, NonPositiveCeilingStillRunsOnce) {
    auto controller = MakeController(0);
    int calls = 0;
    EXPECT_THROW(RunController(controller,
                               [&](int) -> net::awaitable<void> {
                                   ++calls;
                                   throw TransferError(TransferErrc::kConnectFailure, "refused");
                                   co_return;
                               }),
                 TransferError);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays_.empty());
}

TEST(RetryControllerTimerTest, DefaultDelayWaitsTheInterval) {
    RetryController controller(RetryPolicy{.max_attempts = 3, .interval = std::chrono::milliseconds(20)});

    auto start = std::chrono::steady_clock::now();
    int attempt = RunController(controller, [](int i) -> net::awaitable<void> {
        if (i < 3) {
            throw TransferError(TransferErrc::kConnectFailure, "refused");
        }
        co_return;
    });
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(attempt, 3);
    EXPECT_GE(elapsed, std::chrono::milliseconds(40));
}
