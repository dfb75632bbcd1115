#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <cli/progress_display.h>
#include <cli/status_display.h>
#include <core/network/client/target.h>
#include <core/network/client/transfer_client.h>
#include <core/network/server/status_reporter.h>
#include <core/network/server/transfer_server.h>
#include <core/util/archiver.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace net = boost::asio;
namespace po = boost::program_options;

using namespace ferry;

namespace {

void PrintUsage(const po::options_description& server_desc,
                const po::options_description& send_desc) {
    std::cout << "ferry - resumable single-file transfer\n\n"
              << "Usage:\n"
              << "  ferry server [options]                  - receive files\n"
              << "  ferry send <host[:port]> <file> [options] - send one file\n"
              << "  ferry send <host[:port]> --path <dir> [--output <name>]\n"
              << "                                          - zip a directory and send it\n"
              << "  ferry help                              - show this help\n\n"
              << server_desc << "\n"
              << send_desc << "\n";
}

// Config file first, then the command line on top of it
void LoadSettings(const po::variables_map& vm) {
    if (vm.count("config")) {
        core::InitConfig(fs::path(vm["config"].as<std::string>()));
    } else {
        core::InitConfig();
    }
    if (vm.count("log-level")) {
        core::settings.log.level = vm["log-level"].as<std::string>();
    }
}

int RunServer(const po::variables_map& vm, core::Logger& logger) {
    auto& s = core::settings.server;
    if (vm.count("port")) {
        s.port = vm["port"].as<std::uint16_t>();
    }
    if (vm.count("storage-dir")) {
        s.storage_dir = vm["storage-dir"].as<std::string>();
    }
    bool dashboard = !vm.count("no-dashboard");

    net::io_context io_context;

    core::TransferServer server(io_context,
                                core::ServerOptions{
                                    .listen_address = s.listen_address,
                                    .port = s.port,
                                    .storage_dir = s.storage_dir,
                                    .read_timeout = std::chrono::seconds(s.read_timeout),
                                    .max_sessions = s.max_sessions,
                                });
    try {
        server.Start();
    } catch (const std::exception& e) {
        std::cerr << "Failed to start server: " << e.what() << "\n";
        return 1;
    }

    cli::StatusDisplay display;
    core::StatusCallback on_status;
    if (dashboard) {
        logger.set_console_level(core::Logger::Level::off);
        display.PrintBanner(server.port(), s.storage_dir.string());
        on_status = [&display](const core::StatusSnapshot& snapshot) { display.Render(snapshot); };
    } else {
        std::cout << "Listening on port " << server.port() << ", storing files in "
                  << s.storage_dir.string() << "\n"
                  << "Press Ctrl+C to stop the server...\n";
    }

    core::StatusReporter reporter(io_context,
                                  server.registry(),
                                  server.stats(),
                                  std::chrono::milliseconds(s.status_interval),
                                  on_status,
                                  s.status_file);
    if (dashboard || !s.status_file.empty()) {
        reporter.Start();
    }

    net::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&io_context](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down.", signal);
            io_context.stop();
        }
    });

    unsigned int num_threads = s.worker_threads > 0 ? s.worker_threads
                                                    : std::thread::hardware_concurrency();
    std::vector<std::thread> threads;
    for (unsigned int i = 1; i < num_threads; ++i) {
        threads.emplace_back([&io_context]() {
            try {
                io_context.run();
            } catch (const std::exception& e) {
                spdlog::error("IO thread error: {}", e.what());
            }
        });
    }

    try {
        io_context.run();
    } catch (const std::exception& e) {
        spdlog::error("IO thread error: {}", e.what());
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    reporter.Stop();
    server.Stop();
    std::cout << "\nServer stopped.\n";
    return 0;
}

int RunSend(const po::variables_map& vm, core::Logger& logger) {
    if (!vm.count("target") || (!vm.count("file") && !vm.count("path"))) {
        std::cerr << "Error: send needs a target host and a file or --path directory\n";
        return 1;
    }
    if (vm.count("file") && vm.count("path")) {
        std::cerr << "Error: give either a file or --path, not both\n";
        return 1;
    }

    const auto& c = core::settings.client;
    core::ClientOptions options{
        .resume = c.resume && !vm.count("no-resume"),
        .connect_timeout = std::chrono::seconds(c.connect_timeout),
        .retry =
            core::RetryPolicy{
                .max_attempts = vm.count("retries") ? vm["retries"].as<int>() : c.max_attempts,
                .interval = std::chrono::milliseconds(vm.count("retry-interval")
                                                          ? vm["retry-interval"].as<unsigned int>()
                                                          : c.retry_interval),
            },
    };

    // host:port wins over --port
    try {
        auto target = core::ParseTarget(vm["target"].as<std::string>(),
                                        vm.count("port") ? vm["port"].as<std::uint16_t>()
                                                         : core::transfer::kDefaultPort);
        options.host = std::move(target.host);
        options.port = target.port;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    fs::path file_path;
    if (vm.count("path")) {
        try {
            file_path = core::Archiver::CompressDirectory(
                vm["path"].as<std::string>(),
                vm.count("output") ? fs::path(vm["output"].as<std::string>()) : fs::path());
        } catch (const std::exception& e) {
            std::cerr << "Error compressing directory: " << e.what() << "\n";
            return 1;
        }
        std::cout << "Compressed into " << file_path.string() << "\n";
    } else {
        file_path = vm["file"].as<std::string>();
    }
    if (!fs::is_regular_file(file_path)) {
        std::cerr << "Error: file does not exist: " << file_path.string() << "\n";
        return 1;
    }

    // Keep the progress line readable, failures still show up
    logger.set_console_level(core::Logger::Level::warn);

    cli::ProgressDisplay progress(file_path.filename().string());
    options.on_progress = [&progress](std::uint64_t transferred, std::uint64_t total) {
        progress.UpdateProgress(transferred, total);
    };

    net::io_context io_context;
    core::TransferClient client(io_context, std::move(options));

    int exit_code = 1;
    net::co_spawn(io_context,
                  client.SendFile(file_path),
                  [&](std::exception_ptr e, core::TransferResult result) {
                      progress.ClearProgress();
                      if (e) {
                          try {
                              std::rethrow_exception(e);
                          } catch (const std::exception& ex) {
                              std::cerr << "File transfer failed: " << ex.what() << "\n";
                          }
                          return;
                      }
                      std::cout << "File transfer completed successfully.\n";
                      spdlog::info("{} bytes sent from offset {} after {} attempt(s), hash {}",
                                   result.bytes_sent,
                                   result.offset,
                                   result.attempts,
                                   result.checksum);
                      exit_code = 0;
                  });
    io_context.run();

    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description common_desc("Common options");
    common_desc.add_options()("config,c", po::value<std::string>(), "config file")(
        "log-level,l",
        po::value<std::string>(),
        "trace, debug, info, warn or error");

    po::options_description server_desc("Server options");
    server_desc.add_options()("port,p", po::value<std::uint16_t>(), "listen port")(
        "storage-dir,s",
        po::value<std::string>(),
        "directory received files are written to")("no-dashboard", "plain log output");

    po::options_description send_desc("Send options");
    send_desc.add_options()("port,p", po::value<std::uint16_t>(), "server port")(
        "retries,r",
        po::value<int>(),
        "maximum number of attempts")("retry-interval",
                                      po::value<unsigned int>(),
                                      "milliseconds between attempts")(
        "no-resume",
        "always start from byte 0")("path",
                                    po::value<std::string>(),
                                    "zip this directory and send the archive")(
        "output,o",
        po::value<std::string>(),
        "archive name for --path (default <dir>.zip)");

    po::options_description hidden_desc;
    hidden_desc.add_options()("target", po::value<std::string>())("file",
                                                                  po::value<std::string>());

    if (argc < 2) {
        std::cerr << "Error: missing command\n";
        PrintUsage(server_desc, send_desc);
        return 1;
    }

    std::string command = argv[1];
    try {
        po::variables_map vm;
        if (command == "server") {
            po::options_description desc;
            desc.add(common_desc).add(server_desc);
            po::store(po::command_line_parser(argc - 1, argv + 1).options(desc).run(), vm);
        } else if (command == "send") {
            po::options_description desc;
            desc.add(common_desc).add(send_desc).add(hidden_desc);
            po::positional_options_description positional;
            positional.add("target", 1).add("file", 1);
            po::store(po::command_line_parser(argc - 1, argv + 1)
                          .options(desc)
                          .positional(positional)
                          .run(),
                      vm);
        } else if (command == "help" || command == "--help" || command == "-h") {
            PrintUsage(server_desc, send_desc);
            return 0;
        } else {
            std::cerr << "Error: unknown command '" << command << "'\n";
            PrintUsage(server_desc, send_desc);
            return 1;
        }
        po::notify(vm);

        LoadSettings(vm);
        core::Logger logger(core::Logger::ParseLevel(core::settings.log.level),
                            core::settings.log.dir);
        spdlog::info("Welcome to ferry!");

        if (command == "server") {
            return RunServer(vm, logger);
        }
        return RunSend(vm, logger);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        PrintUsage(server_desc, send_desc);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
