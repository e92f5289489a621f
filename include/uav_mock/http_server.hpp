// === HTTP Server =============================================================
//
// Owns the TCP listener and a single I/O thread. Connections are served as
// asynchronous sessions on that thread; each carries one request, answered
// through RequestRouter and then closed. Reads and writes run under a
// deadline so an idle client can neither stall other clients nor hold up
// shutdown.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/logger.h>

#include "uav_mock/configuration.hpp"
#include "uav_mock/request_router.hpp"
#include "uav_mock/telemetry_generator.hpp"

namespace uav_mock {

class HttpSession;

/** @brief Single-threaded HTTP/1.1 listener for the simulator endpoints. */
class HttpServer final {
  public:
    HttpServer(ServerOptions options, std::shared_ptr<const TelemetryGenerator> generator);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind the listener and start the I/O thread.
     *
     * @throws BindError when the address or port is unavailable.
     */
    void start();
    /**
     * @brief Stop accepting, cancel connections still waiting for a request,
     *        let responses already being written finish, release the port.
     */
    void shutdown();

    /** @brief Port actually bound; differs from the option when it was 0. */
    [[nodiscard]] std::uint16_t port() const noexcept;
    [[nodiscard]] bool running() const noexcept;

  private:
    void do_accept();
    void close_on_io_thread();
    void log_banner() const;

    ServerOptions options_;
    std::shared_ptr<const TelemetryGenerator> generator_;
    RequestRouter router_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::weak_ptr<HttpSession>> list_sessions_;  /**< Touched on the I/O thread only. */
    std::uint16_t bound_port_{0};
    std::atomic<bool> flag_running_{false};
    std::thread io_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace uav_mock
