#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace ferry::core;
namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path()
               / ("ferry-config-" + std::string(::testing::UnitTest::GetInstance()
                                                    ->current_test_info()
                                                    ->name()));
        fs::create_directories(dir_);
        path_ = dir_ / "config.toml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void WriteConfig(const std::string& text) {
        std::ofstream ofs(path_);
        ofs << text;
    }

    fs::path dir_;
    fs::path path_;
};

} // namespace

TEST_F(ConfigTest, EmptyFileGivesDefaults) {
    WriteConfig("");
    InitConfig(path_);

    EXPECT_EQ(settings.server.port, transfer::kDefaultPort);
    EXPECT_EQ(settings.server.listen_address, "0.0.0.0");
    EXPECT_EQ(settings.server.storage_dir, fs::path("./uploads"));
    EXPECT_EQ(settings.server.read_timeout, 0u);
    EXPECT_EQ(settings.server.max_sessions, 0u);
    EXPECT_EQ(settings.server.status_interval, 500u);
    EXPECT_TRUE(settings.server.status_file.empty());
    EXPECT_EQ(settings.client.max_attempts, 5);
    EXPECT_EQ(settings.client.retry_interval, 2000u);
    EXPECT_TRUE(settings.client.resume);
    EXPECT_EQ(settings.client.connect_timeout, 10u);
    EXPECT_EQ(settings.log.level, "info");
}

TEST_F(ConfigTest, ReadsEverySection) {
    WriteConfig(R"(
[server]
port = 6000
listen-address = "127.0.0.1"
storage-dir = "/srv/ferry"
read-timeout = 30
max-sessions = 8
status-interval = 250
status-file = "/tmp/ferry-status.json"
worker-threads = 2

[client]
max-attempts = 3
retry-interval = 500
resume = false
connect-timeout = 4

[log]
dir = "/var/log/ferry"
level = "debug"
)");
    InitConfig(path_);

    EXPECT_EQ(settings.server.port, 6000);
    EXPECT_EQ(settings.server.listen_address, "127.0.0.1");
    EXPECT_EQ(settings.server.storage_dir, fs::path("/srv/ferry"));
    EXPECT_EQ(settings.server.read_timeout, 30u);
    EXPECT_EQ(settings.server.max_sessions, 8u);
    EXPECT_EQ(settings.server.status_interval, 250u);
    EXPECT_EQ(settings.server.status_file, fs::path("/tmp/ferry-status.json"));
    EXPECT_EQ(settings.server.worker_threads, 2u);
    EXPECT_EQ(settings.client.max_attempts, 3);
    EXPECT_EQ(settings.client.retry_interval, 500u);
    EXPECT_FALSE(settings.client.resume);
    EXPECT_EQ(settings.client.connect_timeout, 4u);
    EXPECT_EQ(settings.log.dir, fs::path("/var/log/ferry"));
    EXPECT_EQ(settings.log.level, "debug");
}

TEST_F(ConfigTest, UnparsableFileFallsBackToDefaults) {
    WriteConfig("[server\nport = = 1\n");
    InitConfig(path_);

    EXPECT_EQ(settings.server.port, transfer::kDefaultPort);
    EXPECT_EQ(settings.client.max_attempts, 5);
}

TEST_F(ConfigTest, OutOfRangePortFallsBackToDefault) {
    WriteConfig("[server]\nport = 700000\n");
    InitConfig(path_);

    EXPECT_EQ(settings.server.port, transfer::kDefaultPort);
}

TEST_F(ConfigTest, SaveWritesSettingsBack) {
    WriteConfig("");
    InitConfig(path_);
    settings.server.port = 7001;
    settings.client.max_attempts = 9;
    settings.log.level = "warn";
    SaveConfig();

    auto saved = toml::parse_file(path_.string());
    EXPECT_EQ(saved["server"]["port"].value_or(0), 7001);
    EXPECT_EQ(saved["client"]["max-attempts"].value_or(0), 9);
    EXPECT_EQ(saved["log"]["level"].value_or(std::string()), "warn");

    InitConfig(path_);
    EXPECT_EQ(settings.server.port, 7001);
    EXPECT_EQ(settings.client.max_attempts, 9);
}
