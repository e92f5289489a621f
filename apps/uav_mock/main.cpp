#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "uav_mock/configuration.hpp"
#include "uav_mock/http_server.hpp"
#include "uav_mock/logging.hpp"
#include "uav_mock/telemetry_generator.hpp"

namespace {
std::atomic<bool> should_terminate{false};
constexpr std::chrono::milliseconds k_signal_poll_interval{200};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace uav_mock;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();

        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }

        auto generator = std::make_shared<const TelemetryGenerator>(configuration.baseline);
        HttpServer server{configuration.server, generator};
        server.start();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(k_signal_poll_interval);
        }

        server.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
