// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects describing the simulated
// vehicle baseline, the HTTP listener, and logging. `ConfigurationLoader`
// translates environment variables into these structures so downstream
// modules never touch `std::getenv` directly.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "uav_mock/vehicle_state.hpp"

namespace uav_mock {

/** @brief Whether the HTTP layer records one log line per request. */
enum class AccessLogPolicy {
    Disabled,  /**< No per-request output. */
    Enabled    /**< One info line per request with method, target and status. */
};

/**
 * @brief Listener settings consumed by HttpServer.
 */
struct ServerOptions final {
    std::string bind_address{"0.0.0.0"};                /**< Interface to listen on. */
    std::uint16_t port{9090};                           /**< TCP port; 0 selects an ephemeral port. */
    AccessLogPolicy access_log{AccessLogPolicy::Disabled};
};

/**
 * @brief Immutable bundle of runtime knobs for the simulator.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::optional<std::string> log_directory{};  /**< Rotating log file directory; unset logs to stdout only. */
    std::string log_level{};       /**< spdlog level name; empty keeps the default. */
    SimulatorBaseline baseline{};  /**< Vehicle identity and telemetry baseline. */
    ServerOptions server{};        /**< HTTP listener settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 *
 * Absent variables take their documented defaults. A numeric variable that is
 * present but unparseable raises ConfigError.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

    /** @brief Read only the vehicle baseline; does not touch the logger. */
    static SimulatorBaseline load_baseline();
};

}  // namespace uav_mock
