#pragma once
/**
 * @file   config.hpp
 * @brief  Tuning parameters of the focus indicator.
 */

#include <arfocus/core/numeric.hpp>

#include <spdlog/logger.h>

#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace arfocus::core
{
    /**
     * @brief When pose smoothing and display derivation run while a surface is detected.
     */
    enum class DetectionUpdatePolicy
    {
        EveryTick, ///< Every detecting tick (continuous tracking).
        OnChange   ///< Only when the detected surface kind or plane changes.
    };

    /**
     * @struct FocusConfig
     * @brief  Aggregate of every tunable of the focus indicator.
     *
     * Defaults reproduce the constants in numeric.hpp. Call @ref validate before
     * use; the components taking a FocusConfig do so in their constructors.
     */
    struct FocusConfig
    {
        std::size_t historyCapacity{POSITION_HISTORY_CAPACITY}; ///< Averaged hit positions
        double nearScaleDistance{NEAR_SCALE_DISTANCE};         ///< [m]
        double farScaleSlope{FAR_SCALE_SLOPE};                 ///< [1/m]
        double farScaleOffset{FAR_SCALE_OFFSET};               ///< [-]
        double steepTiltThreshold{STEEP_TILT_THRESHOLD};       ///< [rad]
        int orientationRefreshTicks{ORIENTATION_REFRESH_TICKS}; ///< Ticks between surface orientation updates
        double billboardDistance{BILLBOARD_DISTANCE};         ///< [m]
        double visibilityFadeDuration{VISIBILITY_FADE_DURATION}; ///< [s]
        double reorientationDuration{REORIENTATION_DURATION};  ///< [s]
        DetectionUpdatePolicy updatePolicy{DetectionUpdatePolicy::EveryTick};

        /// Destination of diagnostics; null selects spdlog's default logger.
        std::shared_ptr<spdlog::logger> logger{};

        /**
         * @brief Check every field.
         * @throws std::invalid_argument naming the first offending field.
         */
        void validate () const
        {
            if (historyCapacity < 1)
                throw std::invalid_argument ("FocusConfig: historyCapacity must be >= 1");
            if (!(nearScaleDistance > 0.0) || !std::isfinite (nearScaleDistance))
                throw std::invalid_argument ("FocusConfig: nearScaleDistance must be positive");
            if (!(farScaleSlope >= 0.0) || !std::isfinite (farScaleSlope))
                throw std::invalid_argument ("FocusConfig: farScaleSlope must be >= 0");
            if (!std::isfinite (farScaleOffset))
                throw std::invalid_argument ("FocusConfig: farScaleOffset must be finite");
            if (!(steepTiltThreshold > 0.0 && steepTiltThreshold <= PI_OVER_TWO))
                throw std::invalid_argument ("FocusConfig: steepTiltThreshold must be in (0, pi/2]");
            if (orientationRefreshTicks < 1)
                throw std::invalid_argument ("FocusConfig: orientationRefreshTicks must be >= 1");
            if (!(billboardDistance > 0.0) || !std::isfinite (billboardDistance))
                throw std::invalid_argument ("FocusConfig: billboardDistance must be positive");
            if (!(visibilityFadeDuration >= 0.0) || !std::isfinite (visibilityFadeDuration))
                throw std::invalid_argument ("FocusConfig: visibilityFadeDuration must be >= 0");
            if (!(reorientationDuration >= 0.0) || !std::isfinite (reorientationDuration))
                throw std::invalid_argument ("FocusConfig: reorientationDuration must be >= 0");
        }
    };

} // namespace arfocus::core
