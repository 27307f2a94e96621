#pragma once
/**
 * @file   pose_smoother.hpp
 * @brief  Jitter filtering of the indicator pose: windowed position mean,
 *         distance-based scale and hysteresis-gated reorientation.
 *
 * Orientation follows one of two regimes depending on camera pitch:
 *  - steep tilt (looking near-vertically down or up): yaw-only rotation
 *    about world up, one transition in flight at a time;
 *  - shallow tilt: full surface orientation of the hit, refreshed once
 *    every N ticks, or at once after a steep-tilt phase.
 */

#include <arfocus/core/config.hpp>
#include <arfocus/core/math.hpp>
#include <arfocus/host/types.hpp>
#include <arfocus/tracking/position_history.hpp>

#include <cmath>
#include <optional>

namespace arfocus::tracking
{
    using core::Quat;
    using core::Transform;
    using core::Vec3;

    /**
     * @struct OrientationUpdate
     * @brief  Rotation the node should animate to.
     */
    struct OrientationUpdate
    {
        Quat orientation = Quat::Identity (); ///< Target world orientation
        double duration{};                    ///< Animation duration [s]
        bool yawOnly{false};                  ///< Steep-tilt correction; completion must be reported back
    };

    /**
     * @struct SmoothedPose
     * @brief  Filtered pose produced for one detecting tick.
     */
    struct SmoothedPose
    {
        Vec3 position = Vec3::Zero ();                  ///< Mean of recent hit positions
        double scale{1.0};                              ///< Uniform display scale
        std::optional<OrientationUpdate> orientation{}; ///< Empty ⇒ leave orientation as is
    };

    /**
     * @brief Distance-based display scale.
     *
     * Shrinks linearly below @c nearScaleDistance and grows gently above it;
     * with the default parameters both branches equal 1 at 0.7 m.
     *
     * @param distance Camera-to-indicator distance [m].
     * @param cfg      Scale parameters.
     */
    [[nodiscard]] inline double distanceScale (double distance, const core::FocusConfig &cfg) noexcept
    {
        if (distance < cfg.nearScaleDistance)
            return distance / cfg.nearScaleDistance;
        return cfg.farScaleSlope * distance + cfg.farScaleOffset;
    }

    /**
     * @brief Yaw of a camera about world up, from its local X/Y basis.
     * @param camera Camera-to-world transform.
     */
    [[nodiscard]] inline double cameraYaw (const Transform &camera) noexcept { return std::atan2 (camera.matrix () (0, 0), camera.matrix () (0, 1)); }

    /**
     * @brief Stateful pose filter fed with one raycast hit per tick.
     *
     * Not thread-safe; owned and driven by a single work queue.
     */
    class PoseSmoother final
    {
      public:
        /**
         * @param cfg Tuning parameters.
         * @throws std::invalid_argument if @p cfg is invalid.
         */
        explicit PoseSmoother (const core::FocusConfig &cfg = {}) : cfg_ ((cfg.validate (), cfg)), history_ (cfg.historyCapacity) {}

        /**
         * @brief Filter one hit.
         * @param hit    World transform of the raycast hit.
         * @param camera Camera of the same frame, if any.
         * @return Smoothed pose. Without a camera the scale is 1 and orientation is left untouched.
         */
        SmoothedPose update (const Transform &hit, const std::optional<host::CameraPose> &camera)
        {
            SmoothedPose out;
            out.position = history_.push (hit.translation ());

            if (!camera)
                return out;

            out.scale = distanceScale (core::distance (out.position, camera->transform.translation ()), cfg_);
            out.orientation = updateOrientation (hit, *camera);
            return out;
        }

        /// @brief Report that a yaw-only transition finished.
        void completeReorientation () noexcept
        {
            changingOrientation_ = false;
            pointingDownwards_ = true;
        }

        /// @brief Forget all position samples (tracking was lost).
        void reset () noexcept { history_.clear (); }

        [[nodiscard]] const PositionHistory &history () const noexcept { return history_; }
        [[nodiscard]] bool isChangingOrientation () const noexcept { return changingOrientation_; }
        [[nodiscard]] bool isPointingDownwards () const noexcept { return pointingDownwards_; }
        [[nodiscard]] int ticksSinceOrientationUpdate () const noexcept { return orientationCounter_; }

      private:
        std::optional<OrientationUpdate> updateOrientation (const Transform &hit, const host::CameraPose &camera)
        {
            if (camera.tilt () > cfg_.steepTiltThreshold)
            {
                if (changingOrientation_)
                    return std::nullopt;

                changingOrientation_ = true;
                const double duration = pointingDownwards_ ? 0.0 : cfg_.reorientationDuration;
                return OrientationUpdate{core::fromAxisAngle (cameraYaw (camera.transform), Vec3::UnitY ()), duration, true};
            }

            std::optional<OrientationUpdate> update;
            if (orientationCounter_ == cfg_.orientationRefreshTicks || pointingDownwards_)
            {
                orientationCounter_ = 0;
                pointingDownwards_ = false;
                update = OrientationUpdate{core::orientationOf (hit), cfg_.reorientationDuration, false};
            }
            ++orientationCounter_;
            return update;
        }

        core::FocusConfig cfg_;
        PositionHistory history_;

        bool changingOrientation_ = false;
        bool pointingDownwards_ = true; // the first shallow update applies at once
        int orientationCounter_ = 0;
    };

} // namespace arfocus::tracking
