#pragma once
/**
 * @file   numeric.hpp
 * @brief  Project-wide numerical constants and tolerances.
 *
 * Every tuning constant of the focus indicator lives here; @ref arfocus::core::FocusConfig
 * takes its defaults from these values.
 */

#include <cstddef>
#include <limits>
#include <numbers>

namespace arfocus::core
{
    /**
     * @brief Machine epsilon for a given floating-point type.
     * @tparam T Floating-point type.
     */
    template <typename T> inline constexpr T EPSILON_V = std::numeric_limits<T>::epsilon ();

    /**
     * @brief π specialized for a given floating-point type.
     * @tparam T Floating-point type.
     */
    template <typename T> inline constexpr T PI_V = std::numbers::pi_v<T>;

    /*────────────────── Common double-precision constants ──────────────────*/

    /// Absolute tolerance used across the project (double precision).
    inline constexpr double EPSILON = EPSILON_V<double>;

    /// π in double precision.
    inline constexpr double PI = PI_V<double>;

    /// π/2 in double precision.
    inline constexpr double PI_OVER_TWO = PI / 2.0;

    /// Tolerance used when comparing rotations and unit vectors.
    inline constexpr double ROTATION_TOL = 1e-9;

    /*────────────────── Position smoothing ─────────────────────────────────*/

    /// Number of recent hit positions averaged into the displayed position.
    inline constexpr std::size_t POSITION_HISTORY_CAPACITY = 10;

    /*────────────────── Distance-based scale [m] ───────────────────────────*/

    /// Below this camera distance the indicator shrinks linearly towards zero.
    inline constexpr double NEAR_SCALE_DISTANCE = 0.7;

    /// Slope of the far branch: scale = slope · d + offset.
    inline constexpr double FAR_SCALE_SLOPE = 0.25;

    /// Offset of the far branch; 0.25 · 0.7 + 0.825 = 1 keeps both branches continuous.
    inline constexpr double FAR_SCALE_OFFSET = 0.825;

    /*────────────────── Orientation hysteresis ─────────────────────────────*/

    /// Camera pitch above which only a yaw correction is applied (75 % of 90°).
    inline constexpr double STEEP_TILT_THRESHOLD = PI_OVER_TWO * 0.75;

    /// Shallow-tilt surface orientation is adopted once every N ticks.
    inline constexpr int ORIENTATION_REFRESH_TICKS = 15;

    /*────────────────── Billboard & animation ──────────────────────────────*/

    /// Distance in front of the camera at which the billboard is shown [m].
    inline constexpr double BILLBOARD_DISTANCE = 0.8;

    /// Visibility cross-fade duration [s].
    inline constexpr double VISIBILITY_FADE_DURATION = 0.35;

    /// Reorientation animation duration [s].
    inline constexpr double REORIENTATION_DURATION = 0.5;

} // namespace arfocus::core
