#include "uav_mock/telemetry_generator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace uav_mock {

namespace {
constexpr double k_position_amplitude_deg{0.0001};     /**< Peak offset from the GPS origin. */
constexpr double k_position_rate_rad_per_s{0.1};       /**< Angular rate of the position orbit. */
constexpr double k_battery_drain_percent_per_s{0.001}; /**< Linear drain; 0.1% every 100 s. */
constexpr double k_battery_floor_percent{20.0};        /**< Charge never reported below this. */
constexpr double k_battery_warning_percent{30.0};      /**< At or below this the status is Warning. */
}  // namespace

TelemetryGenerator::TelemetryGenerator(SimulatorBaseline baseline)
    : TelemetryGenerator(std::move(baseline), WallClock::now()) {}

TelemetryGenerator::TelemetryGenerator(SimulatorBaseline baseline, TimePoint start_time)
    : state_{std::move(baseline), start_time} {}

const SimulatorState& TelemetryGenerator::state() const noexcept {
    return state_;
}

TelemetrySnapshot TelemetryGenerator::current_snapshot() const {
    return snapshot_at(WallClock::now());
}

TelemetrySnapshot TelemetryGenerator::snapshot_at(TimePoint now) const {
    const SimulatorBaseline& baseline = state_.baseline;
    const double elapsed_s = Duration{now - state_.start_time}.count();

    const double lat_offset = k_position_amplitude_deg * std::sin(elapsed_s * k_position_rate_rad_per_s);
    const double lon_offset = k_position_amplitude_deg * std::cos(elapsed_s * k_position_rate_rad_per_s);

    const double battery_drain = elapsed_s * k_battery_drain_percent_per_s;
    const double current_battery = std::max(k_battery_floor_percent, baseline.battery.initial_percent - battery_drain);

    TelemetrySnapshot snapshot{};
    snapshot.uav_id = baseline.identity.uav_id;
    snapshot.node_name = baseline.identity.node_name;
    snapshot.system_time = format_system_time(now);

    snapshot.gps.latitude_deg = baseline.gps.latitude_deg + lat_offset;
    snapshot.gps.longitude_deg = baseline.gps.longitude_deg + lon_offset;
    snapshot.gps.altitude_m = baseline.gps.altitude_m;
    snapshot.gps.satellite_count = baseline.gps.satellite_count;
    snapshot.gps.fix_type = baseline.gps.fix_type;

    snapshot.battery.voltage_v = baseline.battery.voltage_v;
    snapshot.battery.remaining_percent = round_to_tenths(current_battery);
    snapshot.battery.temperature_c = baseline.battery.temperature_c;

    snapshot.flight = baseline.flight;
    snapshot.system_status = current_battery > k_battery_warning_percent ? SystemStatus::Ok : SystemStatus::Warning;
    return snapshot;
}

std::string format_system_time(TimePoint time) {
    const auto since_epoch = time.time_since_epoch();
    const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - whole_seconds).count();
    const std::time_t raw_time = static_cast<std::time_t>(whole_seconds.count());
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}Z", fmt::gmtime(raw_time), micros);
}

double round_to_tenths(double value) {
    // nearbyint honours the default round-to-nearest-even mode.
    return std::nearbyint(value * 10.0) / 10.0;
}

std::string_view to_string(SystemStatus status) noexcept {
    switch (status) {
        case SystemStatus::Ok:
            return "OK";
        case SystemStatus::Warning:
            return "WARNING";
    }
    return "WARNING";
}

}  // namespace uav_mock
