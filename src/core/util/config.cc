#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace ferry::core {

static toml::table& Section(std::string_view name) {
    if (!config.contains(name)) {
        config.insert(name, toml::table{});
    }
    return *config[name].as_table();
}

static void LoadServerSetting() {
    auto& server = Section("server");
    auto& s = settings.server;

    s.port = server["port"].value_or(transfer::kDefaultPort);
    s.listen_address = server["listen-address"].value_or(std::string("0.0.0.0"));
    s.storage_dir = server["storage-dir"].value_or(path::kDefaultStorageDir.string());
    s.read_timeout = server["read-timeout"].value_or(0u);
    s.max_sessions = server["max-sessions"].value_or(0u);
    s.status_interval = server["status-interval"].value_or(transfer::kDefaultStatusIntervalMs);
    s.status_file = server["status-file"].value_or(std::string());
    s.worker_threads = server["worker-threads"].value_or(0u);
}

static void LoadClientSetting() {
    auto& client = Section("client");
    auto& c = settings.client;

    c.max_attempts = client["max-attempts"].value_or(transfer::kDefaultMaxAttempts);
    c.retry_interval = client["retry-interval"].value_or(transfer::kDefaultRetryIntervalMs);
    c.resume = client["resume"].value_or(true);
    c.connect_timeout = client["connect-timeout"].value_or(
        transfer::kDefaultConnectTimeoutSeconds);
}

static void LoadLogSetting() {
    auto& log = Section("log");
    auto& l = settings.log;

    l.dir = log["dir"].value_or(path::kLogDir.string());
    l.level = log["level"].value_or(std::string("info"));
}

void InitConfig() {
    if (!std::filesystem::exists(path::kConfigDir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::error_code ec;
        std::filesystem::create_directories(path::kConfigDir, ec);
        if (ec) {
            spdlog::error("Failed to create config directory \"{}\": {}",
                          path::kConfigDir.string(),
                          ec.message());
        }
    }
    auto path = path::kConfigDir / "config.toml";
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    InitConfig(path);
}

void InitConfig(const std::filesystem::path& path) {
    config_path = path;
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadServerSetting();
    LoadClientSetting();
    LoadLogSetting();
}

void SaveConfig() {
    auto path = config_path.empty() ? path::kConfigDir / "config.toml" : config_path;
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }

    const auto& s = settings.server;
    config.insert_or_assign("server",
                            toml::table{
                                {"port", s.port},
                                {"listen-address", s.listen_address},
                                {"storage-dir", s.storage_dir.string()},
                                {"read-timeout", s.read_timeout},
                                {"max-sessions", s.max_sessions},
                                {"status-interval", s.status_interval},
                                {"status-file", s.status_file.string()},
                                {"worker-threads", s.worker_threads},
                            });
    const auto& c = settings.client;
    config.insert_or_assign("client",
                            toml::table{
                                {"max-attempts", c.max_attempts},
                                {"retry-interval", c.retry_interval},
                                {"resume", c.resume},
                                {"connect-timeout", c.connect_timeout},
                            });
    config.insert_or_assign("log",
                            toml::table{
                                {"dir", settings.log.dir.string()},
                                {"level", settings.log.level},
                            });
    ofs << config;
}

} // namespace ferry::core
