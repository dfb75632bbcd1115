#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/io_context.hpp>
#include <core/network/server/status_reporter.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

using namespace ferry::core;
namespace fs = std::filesystem;
namespace net = boost::asio;

namespace {

SessionRecord MakeRecord(const std::string& id) {
    SessionRecord record;
    record.id = id;
    record.peer_address = "127.0.0.1:40000";
    record.file_name = id + ".bin";
    record.file_size = 10;
    record.start_time = std::chrono::system_clock::now();
    return record;
}

class StatusReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.Add(MakeRecord("running"));
        registry_.Add(MakeRecord("finished"));
        registry_.Complete("finished", SessionStatus::kCompleted, "abc");
        stats_.ConnectionOpened();
        stats_.AddBytes(42);

        status_file_ = fs::temp_directory_path()
                       / ("ferry-status-" + std::string(::testing::UnitTest::GetInstance()
                                                            ->current_test_info()
                                                            ->name())
                          + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(status_file_, ec);
    }

    net::io_context io_context_;
    SessionRegistry registry_;
    TransferStats stats_;
    fs::path status_file_;
};

} // namespace

TEST_F(StatusReporterTest, CollectReadsRegistryAndCounters) {
    StatusReporter reporter(io_context_, registry_, stats_, std::chrono::milliseconds(500));
    auto snapshot = reporter.Collect();

    EXPECT_EQ(snapshot.stats.active_connections, 1);
    EXPECT_EQ(snapshot.stats.total_bytes, 42u);
    ASSERT_EQ(snapshot.active.size(), 1u);
    EXPECT_EQ(snapshot.active[0].id, "running");
    ASSERT_EQ(snapshot.completed.size(), 1u);
    EXPECT_EQ(snapshot.completed[0].id, "finished");

    // Reporting is read-only
    EXPECT_EQ(registry_.ActiveCount(), 1u);
}

TEST_F(StatusReporterTest, WritesJsonStatusFile) {
    StatusReporter reporter(io_context_,
                            registry_,
                            stats_,
                            std::chrono::milliseconds(500),
                            nullptr,
                            status_file_);
    reporter.WriteStatusFile(reporter.Collect());

    std::ifstream ifs(status_file_);
    ASSERT_TRUE(ifs.is_open());
    auto json = nlohmann::json::parse(ifs);

    EXPECT_EQ(json["active_connections"], 1);
    EXPECT_EQ(json["total_bytes"], 42);
    ASSERT_EQ(json["active"].size(), 1u);
    EXPECT_EQ(json["active"][0]["status"], "in-progress");
    ASSERT_EQ(json["completed"].size(), 1u);
    EXPECT_EQ(json["completed"][0]["status"], "completed");
    EXPECT_EQ(json["completed"][0]["computed_hash"], "abc");
    EXPECT_FALSE(fs::exists(fs::path(status_file_.string() + ".tmp")));
}

TEST_F(StatusReporterTest, TimerLoopInvokesCallback) {
    std::atomic<int> reports{0};
    StatusReporter reporter(io_context_,
                            registry_,
                            stats_,
                            std::chrono::milliseconds(10),
                            [&reports](const StatusSnapshot& snapshot) {
                                EXPECT_EQ(snapshot.active.size(), 1u);
                                ++reports;
                            },
                            status_file_);
    reporter.Start();
    io_context_.run_for(std::chrono::milliseconds(200));
    reporter.Stop();

    EXPECT_GE(reports.load(), 2);
    EXPECT_TRUE(fs::exists(status_file_));
}

TEST_F(StatusReporterTest, ZeroIntervalIsRaisedToOneMillisecond) {
    int reports = 0;
    StatusReporter reporter(io_context_,
                            registry_,
                            stats_,
                            std::chrono::milliseconds(0),
                            [&reports](const StatusSnapshot&) { ++reports; });
    EXPECT_EQ(reporter.interval(), std::chrono::milliseconds(1));

    reporter.Start();
    io_context_.run_for(std::chrono::milliseconds(50));
    reporter.Stop();

    // One report per elapsed millisecond at most, never a busy loop
    EXPECT_GE(reports, 1);
    EXPECT_LE(reports, 60);
}
