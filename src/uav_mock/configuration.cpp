// === Configuration Loader ====================================================
//
// Centralizes parsing of the environment-driven settings that describe the
// simulated vehicle. `ConfigurationLoader` turns raw environment variables
// into the strongly-typed `Configuration` structure consumed by the telemetry
// generator and the HTTP server.
//
// Responsibilities
// - Apply the documented default for every absent variable.
// - Reject numeric variables that are present but malformed with ConfigError,
//   so startup aborts before the listener binds.
// - Keep the narrow `FLIGHT_ARMED` rule: only a case-insensitive "true" arms
//   the vehicle.
//
// Note: This file intentionally avoids reading from disk; callers are expected
// to populate the process environment ahead of time (container manifest, shell).

#include "uav_mock/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string_view>

#include <fmt/format.h>

#include "uav_mock/errors.hpp"
#include "uav_mock/logging.hpp"

namespace uav_mock {

namespace {
constexpr std::string_view k_default_uav_id{"UAV-UNKNOWN"};
constexpr std::string_view k_default_node_name{"unknown-node"};
constexpr double k_default_latitude_deg{39.9042};
constexpr double k_default_longitude_deg{116.4074};
constexpr double k_default_altitude_m{50.0};
constexpr int k_default_satellite_count{12};
constexpr int k_default_fix_type{3};
constexpr double k_default_voltage_v{22.2};
constexpr double k_default_battery_percent{85.0};
constexpr double k_default_temperature_c{28.0};
constexpr std::string_view k_default_flight_mode{"AUTO"};
constexpr std::string_view k_default_armed{"true"};
constexpr double k_default_ground_speed_mps{5.0};

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string read_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

double parse_double(const char* variable_name, double fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string str_value{raw_value};
    // stod would otherwise accept hexadecimal floats.
    if (str_value.find_first_of("xX") != std::string::npos) {
        throw ConfigError(fmt::format("{} must be a number; got '{}'", variable_name, str_value));
    }
    std::size_t consumed{0};
    double parsed_value{};
    try {
        parsed_value = std::stod(str_value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("{} must be a number; got '{}'", variable_name, str_value));
    }
    if (!is_blank(std::string_view{str_value}.substr(consumed))) {
        throw ConfigError(fmt::format("{} must be a number; got '{}'", variable_name, str_value));
    }
    return parsed_value;
}

int parse_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string str_value{raw_value};
    std::size_t consumed{0};
    int parsed_value{};
    try {
        parsed_value = std::stoi(str_value, &consumed, 10);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("{} must be an integer; got '{}'", variable_name, str_value));
    }
    if (!is_blank(std::string_view{str_value}.substr(consumed))) {
        throw ConfigError(fmt::format("{} must be an integer; got '{}'", variable_name, str_value));
    }
    return parsed_value;
}

bool parse_armed(const char* variable_name) {
    std::string str_value = read_string(variable_name, k_default_armed);
    std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str_value == "true";
}

std::optional<std::string> parse_log_directory() {
    const char* raw_directory = std::getenv("UAV_MOCK_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();
    config.log_level = read_string("UAV_MOCK_LOG_LEVEL", "");

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.baseline = load_baseline();

    const SimulatorBaseline& baseline = config.baseline;
    logger->info("Configuration loaded: uav_id={} node={} gps=({}, {}, {}) battery={}% mode={} armed={}",
                 baseline.identity.uav_id,
                 baseline.identity.node_name,
                 baseline.gps.latitude_deg,
                 baseline.gps.longitude_deg,
                 baseline.gps.altitude_m,
                 baseline.battery.initial_percent,
                 baseline.flight.mode,
                 baseline.flight.armed);

    return config;
}

SimulatorBaseline ConfigurationLoader::load_baseline() {
    SimulatorBaseline baseline{};

    baseline.identity.uav_id = read_string("UAV_ID", k_default_uav_id);
    baseline.identity.node_name = read_string("NODE_NAME", k_default_node_name);

    baseline.gps.latitude_deg = parse_double("GPS_LAT", k_default_latitude_deg);
    baseline.gps.longitude_deg = parse_double("GPS_LON", k_default_longitude_deg);
    baseline.gps.altitude_m = parse_double("GPS_ALT", k_default_altitude_m);
    baseline.gps.satellite_count = parse_int("GPS_SATS", k_default_satellite_count);
    if (baseline.gps.satellite_count < 0) {
        throw ConfigError(fmt::format("GPS_SATS must be non-negative; got {}", baseline.gps.satellite_count));
    }
    baseline.gps.fix_type = parse_int("GPS_FIX", k_default_fix_type);

    baseline.battery.voltage_v = parse_double("BATT_VOLTAGE", k_default_voltage_v);
    baseline.battery.initial_percent = parse_double("BATT_PERCENT", k_default_battery_percent);
    baseline.battery.temperature_c = parse_double("BATT_TEMP", k_default_temperature_c);

    baseline.flight.mode = read_string("FLIGHT_MODE", k_default_flight_mode);
    baseline.flight.armed = parse_armed("FLIGHT_ARMED");
    baseline.flight.ground_speed_mps = parse_double("FLIGHT_SPEED", k_default_ground_speed_mps);

    return baseline;
}

}  // namespace uav_mock
