#include "uav_mock/http_server.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>

#include "uav_mock/errors.hpp"
#include "uav_mock/logging.hpp"
#include "uav_mock/version.hpp"

namespace uav_mock {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {
constexpr std::chrono::seconds k_request_timeout{10};  /**< Deadline for a client to send its request. */
constexpr std::chrono::seconds k_response_timeout{10}; /**< Deadline for the response to drain. */
}  // namespace

/**
 * @brief One accepted connection: read a request, write the response, close.
 */
class HttpSession final : public std::enable_shared_from_this<HttpSession> {
  public:
    HttpSession(tcp::socket socket, const RequestRouter& router, std::shared_ptr<spdlog::logger> logger)
        : stream_(std::move(socket)),
          router_(router),
          logger_(std::move(logger)) {}

    void run() {
        stream_.expires_after(k_request_timeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    /** @brief Abort the read if the request has not arrived yet. */
    void cancel_pending_read() {
        if (flag_awaiting_request_) {
            stream_.cancel();
        }
    }

  private:
    void on_read(beast::error_code error_read, std::size_t) {
        flag_awaiting_request_ = false;
        if (error_read) {
            if (error_read != http::error::end_of_stream && error_read != asio::error::operation_aborted) {
                logger_->debug("Dropped connection: {}", error_read.message());
            }
            close();
            return;
        }

        try {
            response_ = router_.route(request_);
        } catch (const std::exception& exc) {
            logger_->error("Failed to build response for {}: {}",
                           std::string{request_.target().data(), request_.target().size()},
                           exc.what());
            close();
            return;
        }

        stream_.expires_after(k_response_timeout);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code error_write, std::size_t) {
        if (error_write) {
            logger_->debug("Response not delivered: {}", error_write.message());
        }
        close();
    }

    void close() {
        beast::error_code error_shutdown;
        stream_.socket().shutdown(tcp::socket::shutdown_send, error_shutdown);
        if (error_shutdown && error_shutdown != beast::errc::not_connected) {
            logger_->debug("Socket shutdown: {}", error_shutdown.message());
        }
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    HttpResponse response_;
    const RequestRouter& router_;
    bool flag_awaiting_request_{true};
    std::shared_ptr<spdlog::logger> logger_;
};

HttpServer::HttpServer(ServerOptions options, std::shared_ptr<const TelemetryGenerator> generator)
    : options_(std::move(options)),
      generator_(std::move(generator)),
      router_(generator_, options_.access_log),
      io_context_(1),
      acceptor_(io_context_),
      logger_(get_logger()) {}

HttpServer::~HttpServer() {
    shutdown();
}

void HttpServer::start() {
    if (flag_running_.load()) {
        return;
    }

    try {
        const tcp::endpoint endpoint{asio::ip::make_address(options_.bind_address), options_.port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
        bound_port_ = acceptor_.local_endpoint().port();
    } catch (const boost::system::system_error& exc) {
        boost::system::error_code error_close;
        acceptor_.close(error_close);
        if (error_close) {
            logger_->debug("Closing failed listener: {}", error_close.message());
        }
        throw BindError(fmt::format("Unable to bind {}:{}: {}",
                                    options_.bind_address,
                                    options_.port,
                                    exc.code().message()));
    }

    flag_running_.store(true);
    log_banner();
    do_accept();
    io_thread_ = std::thread([this]() { io_context_.run(); });
}

void HttpServer::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down server...");
    asio::post(io_context_, [this]() { close_on_io_thread(); });
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

std::uint16_t HttpServer::port() const noexcept {
    return bound_port_;
}

bool HttpServer::running() const noexcept {
    return flag_running_.load();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [this](beast::error_code error_accept, tcp::socket socket) {
            if (error_accept == asio::error::operation_aborted) {
                return;
            }
            if (error_accept) {
                logger_->warn("Accept failed: {}", error_accept.message());
            } else {
                auto session = std::make_shared<HttpSession>(std::move(socket), router_, logger_);
                list_sessions_.erase(
                    std::remove_if(list_sessions_.begin(), list_sessions_.end(),
                                   [](const std::weak_ptr<HttpSession>& entry) { return entry.expired(); }),
                    list_sessions_.end());
                list_sessions_.push_back(session);
                session->run();
            }
            if (flag_running_.load()) {
                do_accept();
            }
        });
}

/**
 * @brief Release the listener and idle connections so the I/O thread drains.
 */
void HttpServer::close_on_io_thread() {
    boost::system::error_code error_close;
    acceptor_.close(error_close);
    if (error_close) {
        logger_->warn("Error closing listener: {}", error_close.message());
    }
    for (const std::weak_ptr<HttpSession>& entry : list_sessions_) {
        if (auto session = entry.lock()) {
            session->cancel_pending_read();
        }
    }
    list_sessions_.clear();
}

void HttpServer::log_banner() const {
    const VehicleIdentity& identity = generator_->state().baseline.identity;
    logger_->info("UAV Mock Simulator {} started for {} on node {}", k_version, identity.uav_id, identity.node_name);
    logger_->info("Listening on {}:{}", options_.bind_address, bound_port_);
    logger_->info("Available endpoints:");
    logger_->info("  GET {} - Health check", k_health_path);
    logger_->info("  GET {} - UAV state data", k_state_path);
    logger_->info("Access logging: {}", options_.access_log == AccessLogPolicy::Enabled ? "enabled" : "disabled");
}

}  // namespace uav_mock
