// === Telemetry Generator =====================================================
//
// Derives a fresh telemetry snapshot from the immutable simulator baseline and
// the wall-clock time elapsed since construction. The generator holds no
// mutable state, so a single instance may be shared across request handlers.

#pragma once

#include <string>
#include <string_view>

#include "uav_mock/types.hpp"
#include "uav_mock/vehicle_state.hpp"

namespace uav_mock {

/** @brief Coarse health flag derived from the remaining battery charge. */
enum class SystemStatus {
    Ok,       /**< Remaining charge above the warning threshold. */
    Warning   /**< Remaining charge at or below the warning threshold. */
};

/** @brief Position reported in a snapshot. */
struct GpsReading final {
    double latitude_deg{};
    double longitude_deg{};
    double altitude_m{};
    int satellite_count{};
    int fix_type{};
};

/** @brief Battery values reported in a snapshot. */
struct BatteryReading final {
    double voltage_v{};
    double remaining_percent{};  /**< Floored at 20.0 and rounded to one decimal. */
    double temperature_c{};
};

/**
 * @brief Telemetry computed for a single query; never stored.
 */
struct TelemetrySnapshot final {
    std::string uav_id{};
    std::string node_name{};
    std::string system_time{};  /**< UTC, `YYYY-MM-DDTHH:MM:SS.ffffffZ`. */
    GpsReading gps{};
    BatteryReading battery{};
    FlightBaseline flight{};
    SystemStatus system_status{SystemStatus::Ok};
};

/**
 * @brief Time-driven telemetry model over an immutable baseline.
 */
class TelemetryGenerator final {
  public:
    /** @brief Capture the current wall-clock time as the start reference. */
    explicit TelemetryGenerator(SimulatorBaseline baseline);
    TelemetryGenerator(SimulatorBaseline baseline, TimePoint start_time);

    [[nodiscard]] const SimulatorState& state() const noexcept;

    /** @brief Snapshot for the current wall-clock time. */
    [[nodiscard]] TelemetrySnapshot current_snapshot() const;

    /**
     * @brief Snapshot for an explicit instant.
     *
     * Position oscillates by 0.0001 degrees around the origin with angular
     * rate 0.1 rad/s; charge drains 0.001 points per second down to a 20%
     * floor. `system_status` is Ok only while the unrounded charge exceeds 30.
     */
    [[nodiscard]] TelemetrySnapshot snapshot_at(TimePoint now) const;

  private:
    SimulatorState state_;
};

/** @brief Format @p time as ISO-8601 UTC with microseconds and a trailing Z. */
[[nodiscard]] std::string format_system_time(TimePoint time);

/** @brief Round to one decimal place, exact ties going to the even digit. */
[[nodiscard]] double round_to_tenths(double value);

[[nodiscard]] std::string_view to_string(SystemStatus status) noexcept;

}  // namespace uav_mock
