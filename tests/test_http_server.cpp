#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "uav_mock/errors.hpp"
#include "uav_mock/http_server.hpp"

using namespace uav_mock;

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    uav_mock::test::ensure_logger_initialized();
    return true;
}();

std::shared_ptr<const TelemetryGenerator> make_generator() {
    SimulatorBaseline baseline{};
    baseline.identity = VehicleIdentity{"UAV-SERVER", "node-s"};
    baseline.gps = GpsOrigin{10.0, 20.0, 30.0, 8, 3};
    baseline.battery = BatteryBaseline{12.6, 25.0, 30.0};
    baseline.flight = FlightBaseline{"GUIDED", true, 2.5};
    return std::make_shared<const TelemetryGenerator>(baseline);
}

ServerOptions loopback_options() {
    ServerOptions options{};
    options.bind_address = "127.0.0.1";
    options.port = 0;
    return options;
}

HttpResponse send_request(std::uint16_t port, http::verb method, const std::string& target) {
    asio::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), port});

    HttpRequest request{method, target, 11};
    request.set(http::field::host, "127.0.0.1");
    http::write(socket, request);

    beast::flat_buffer buffer;
    HttpResponse response;
    http::read(socket, buffer, response);
    return response;
}
}  // namespace

TEST_CASE("HttpServer serves both endpoints over TCP") {
    HttpServer server{loopback_options(), make_generator()};
    server.start();
    REQUIRE(server.running());
    REQUIRE(server.port() != 0);

    const HttpResponse health = send_request(server.port(), http::verb::get, "/health");
    REQUIRE(health.result() == http::status::ok);
    REQUIRE(nlohmann::json::parse(health.body()).at("uav_id") == "UAV-SERVER");

    const HttpResponse state = send_request(server.port(), http::verb::get, "/api/v1/state");
    REQUIRE(state.result() == http::status::ok);
    const auto data = nlohmann::json::parse(state.body()).at("data");
    REQUIRE(data.at("flight").at("mode") == "GUIDED");
    REQUIRE(data.at("health").at("system_status") == "WARNING");

    const HttpResponse missing = send_request(server.port(), http::verb::post, "/api/v1/state");
    REQUIRE(missing.result() == http::status::not_found);
    REQUIRE(missing.body().empty());

    server.shutdown();
    REQUIRE_FALSE(server.running());
}

TEST_CASE("HttpServer survives a malformed request") {
    HttpServer server{loopback_options(), make_generator()};
    server.start();

    {
        asio::io_context io_context;
        tcp::socket socket(io_context);
        socket.connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), server.port()});
        const std::string garbage{"NOT AN HTTP REQUEST\r\n\r\n"};
        asio::write(socket, asio::buffer(garbage));
        boost::system::error_code error_shutdown;
        socket.shutdown(tcp::socket::shutdown_send, error_shutdown);
        REQUIRE_FALSE(error_shutdown);
    }

    const HttpResponse health = send_request(server.port(), http::verb::get, "/health");
    REQUIRE(health.result() == http::status::ok);
}

TEST_CASE("HttpServer reports BindError when the port is taken") {
    HttpServer first{loopback_options(), make_generator()};
    first.start();

    ServerOptions options = loopback_options();
    options.port = first.port();
    HttpServer second{options, make_generator()};

    REQUIRE_THROWS_AS(second.start(), BindError);
    REQUIRE_FALSE(second.running());
}

TEST_CASE("HttpServer rejects an invalid bind address") {
    ServerOptions options = loopback_options();
    options.bind_address = "not-an-address";
    HttpServer server{options, make_generator()};

    REQUIRE_THROWS_AS(server.start(), BindError);
}

TEST_CASE("HttpServer answers other clients while one connection sits idle") {
    HttpServer server{loopback_options(), make_generator()};
    server.start();

    asio::io_context io_context;
    tcp::socket idle_socket(io_context);
    idle_socket.connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), server.port()});

    const auto started = std::chrono::steady_clock::now();
    const HttpResponse health = send_request(server.port(), http::verb::get, "/health");
    const auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE(health.result() == http::status::ok);
    REQUIRE(waited < std::chrono::seconds{2});
}

TEST_CASE("HttpServer shuts down promptly with an idle connection open") {
    HttpServer server{loopback_options(), make_generator()};
    server.start();

    asio::io_context io_context;
    tcp::socket idle_socket(io_context);
    idle_socket.connect(tcp::endpoint{asio::ip::make_address("127.0.0.1"), server.port()});
    // Give the I/O thread time to accept and start waiting on the request.
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    auto shutdown_done = std::async(std::launch::async, [&server]() { server.shutdown(); });

    REQUIRE(shutdown_done.wait_for(std::chrono::seconds{2}) == std::future_status::ready);
    REQUIRE_FALSE(server.running());
}
