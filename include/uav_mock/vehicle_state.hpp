#pragma once

#include <string>

#include "uav_mock/types.hpp"

namespace uav_mock {

/**
 * @brief Names the simulated vehicle and the node hosting it.
 */
struct VehicleIdentity final {
    std::string uav_id{};     /**< Vehicle identifier reported on every endpoint. */
    std::string node_name{};  /**< Host node the simulator is deployed on. */
};

/**
 * @brief GPS origin around which the simulated position oscillates.
 */
struct GpsOrigin final {
    double latitude_deg{};    /**< Latitude in decimal degrees. */
    double longitude_deg{};   /**< Longitude in decimal degrees. */
    double altitude_m{};      /**< Altitude in metres. */
    int satellite_count{};    /**< Satellites in view. */
    int fix_type{};           /**< Receiver lock-quality code. */
};

/**
 * @brief Battery values the drain model starts from.
 */
struct BatteryBaseline final {
    double voltage_v{};        /**< Pack voltage in volts. */
    double initial_percent{};  /**< Charge at simulator start, 0 to 100. */
    double temperature_c{};    /**< Pack temperature in degrees Celsius. */
};

/**
 * @brief Flight-mode values echoed unchanged in every snapshot.
 */
struct FlightBaseline final {
    std::string mode{};        /**< Flight mode token, e.g. "AUTO". */
    bool armed{};              /**< Whether the motors are armed. */
    double ground_speed_mps{}; /**< Ground speed in metres per second. */
};

/**
 * @brief Immutable configuration bundle from which all telemetry derives.
 */
struct SimulatorBaseline final {
    VehicleIdentity identity{};
    GpsOrigin gps{};
    BatteryBaseline battery{};
    FlightBaseline flight{};
};

/**
 * @brief Baseline plus the reference instant elapsed time is measured from.
 */
struct SimulatorState final {
    SimulatorBaseline baseline{};
    TimePoint start_time{};
};

}  // namespace uav_mock
