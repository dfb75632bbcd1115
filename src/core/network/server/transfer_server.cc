#include <utility>  // Boost 1.74 asio uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/server/transfer_server.h>
#include <spdlog/spdlog.h>

namespace ferry::core {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

TransferServer::TransferServer(net::io_context& io_context, ServerOptions options)
    : io_context_(io_context)
    , options_(std::move(options))
    , acceptor_(io_context)
    , running_(false)
    , port_(0)
    , open_connections_(0)
    , context_{
          .storage_dir = options_.storage_dir,
          .read_timeout = options_.read_timeout,
          .trailer_timeout = options_.trailer_timeout,
          .offset_store = offset_store_,
          .registry = registry_,
          .stats = stats_,
      } {
    spdlog::info("TransferServer created.");
}

TransferServer::~TransferServer() {
    if (running_) {
        Stop();
    }
    spdlog::info("TransferServer destroyed.");
}

void TransferServer::Start() {
    if (running_) {
        spdlog::warn("Server is already running.");
        return;
    }

    try {
        if (!std::filesystem::exists(options_.storage_dir)) {
            spdlog::info("Storage directory {} does not exist, creating...",
                         options_.storage_dir.string());
            std::filesystem::create_directories(options_.storage_dir);
        }

        tcp::endpoint endpoint(net::ip::make_address(options_.listen_address), options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        spdlog::info("Server listening on {}:{}, storing files in {}",
                     options_.listen_address,
                     port_,
                     options_.storage_dir.string());

        net::co_spawn(io_context_, acceptConnections(), net::detached);
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on {}:{}: {}",
                      options_.listen_address,
                      options_.port,
                      e.what());
        running_ = false;
        if (acceptor_.is_open()) {
            boost::system::error_code ec;
            acceptor_.close(ec);
        }
        throw;
    }
}

void TransferServer::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    if (acceptor_.is_open()) {
        acceptor_.close(ec);
    }
    spdlog::info("Server stopped.");
}

net::awaitable<void> TransferServer::acceptConnections() {
    while (running_) {
        try {
            tcp::socket socket = co_await acceptor_.async_accept(net::use_awaitable);

            if (options_.max_sessions > 0 && open_connections_ >= options_.max_sessions) {
                boost::system::error_code ec;
                auto endpoint = socket.remote_endpoint(ec);
                spdlog::warn("Rejecting connection from {}: {} sessions already open",
                             ec ? std::string("unknown") : endpoint.address().to_string(),
                             options_.max_sessions);
                socket.close(ec);
                continue;
            }

            ++open_connections_;
            net::co_spawn(io_context_,
                          handleConnection(beast::tcp_stream(std::move(socket))),
                          net::detached);
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                spdlog::info("Accept operation cancelled.");
                break;
            } else {
                spdlog::error("Error accepting connection: {}", e.what());
            }
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error during accept: {}", e.what());
        }
    }
    spdlog::info("Stopped accepting connections.");
}

net::awaitable<void> TransferServer::handleConnection(beast::tcp_stream stream) {
    try {
        TransferSession session(std::move(stream), context_);
        co_await session.Run();
    } catch (const std::exception& e) {
        spdlog::error("Session error: {}", e.what());
    }
    --open_connections_;
}

} // namespace ferry::core
