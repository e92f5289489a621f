// === Core Types ==============================================================
//
// Collects shared time primitives used throughout the simulator.

#pragma once

#include <chrono>

namespace uav_mock {

/**
 * @brief Alias for the wall clock that drives every time-derived field.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = WallClock::time_point;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

}  // namespace uav_mock
