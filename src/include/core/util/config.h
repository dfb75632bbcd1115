/*
    config.h
    Application configuration stored as a TOML file.

    Example file:

        [server]
        port = 59999
        listen-address = "0.0.0.0"
        storage-dir = "./uploads"
        read-timeout = 0       # seconds, 0 waits forever
        max-sessions = 0       # 0 is unbounded
        status-interval = 500  # milliseconds
        status-file = ""       # JSON snapshot path, empty disables it
        worker-threads = 0     # 0 uses the hardware concurrency

        [client]
        max-attempts = 5
        retry-interval = 2000  # milliseconds
        resume = true
        connect-timeout = 10   # seconds

        [log]
        dir = "/tmp/ferry/logs"
        level = "info"

    Usage:
    - Load the default file (created empty if missing) or a given one:
        ferry::core::InitConfig();
        ferry::core::InitConfig("/path/to/config.toml");
    - Read or change a setting:
        std::uint16_t port = ferry::core::settings.server.port;
        ferry::core::settings.client.max_attempts = 3;
    - Write the settings back to the file they were loaded from:
        ferry::core::SaveConfig();
*/

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace ferry::core {

inline toml::table config;

struct ServerSettings {
    std::uint16_t port;
    std::string listen_address;
    std::filesystem::path storage_dir;
    std::uint32_t read_timeout;    // seconds
    std::uint32_t max_sessions;
    std::uint32_t status_interval; // milliseconds
    std::filesystem::path status_file;
    std::uint32_t worker_threads;
};

struct ClientSettings {
    int max_attempts;
    std::uint32_t retry_interval;  // milliseconds
    bool resume;
    std::uint32_t connect_timeout; // seconds
};

struct LogSettings {
    std::filesystem::path dir;
    std::string level;
};

struct Settings {
    ServerSettings server;
    ClientSettings client;
    LogSettings log;
};

inline Settings settings;

// Path of the file the settings were last loaded from
inline std::filesystem::path config_path;

void InitConfig();

void InitConfig(const std::filesystem::path& path);

void SaveConfig();

} // namespace ferry::core
