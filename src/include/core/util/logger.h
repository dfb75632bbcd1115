#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace ferry::core {

// Installs an async "ferry" logger (daily file + colored console) as the spdlog default.
class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (log_dir / "ferry.log").string(), 0, 0, false, 0, handlers);
        stdout_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        logger_ = std::make_shared<LoggerType>("ferry",
                                               spdlog::sinks_init_list{file_sink, stdout_sink_},
                                               thread_pool_);

#ifdef FERRY_RELEASE
        stdout_sink_->set_level(Level::off);
#endif
        logger_->set_level(level);
        logger_->set_error_handler(
            [&](const std::string& msg) { logger_->error("*** LOGGER ERROR ***: {}", msg); });

        stdout_sink_->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }

    // Raised to off while the server dashboard owns the terminal
    void set_console_level(Level level) { stdout_sink_->set_level(level); }

    // "trace", "debug", "info", "warn", "error", "critical" or "off"; anything else is info
    static Level ParseLevel(std::string_view name) {
        auto level = spdlog::level::from_str(std::string(name));
        if (level == Level::off && name != "off") {
            return Level::info;
        }
        return level;
    }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace ferry::core
