#pragma once
/**
 * @file   detection_state_machine.hpp
 * @brief  Turns raw raycast outcomes into a @ref arfocus::tracking::DetectionState.
 */

#include <arfocus/tracking/detection_state.hpp>

#include <optional>
#include <utility>

namespace arfocus::tracking
{
    /**
     * @struct Observation
     * @brief  Result of feeding one frame to the state machine.
     */
    struct Observation
    {
        DetectionState state; ///< Snapshot of the state after the frame
        bool changed;         ///< Differs by value from the previous state
        bool kindChanged;     ///< Differs in kind (see @ref sameKind)
    };

    /**
     * @brief Detection state holder with change reporting.
     *
     * - no hit ⇒ @ref Initializing (the camera is ignored);
     * - hit on a plane anchor ⇒ @ref Detecting with @ref KnownPlane;
     * - any other hit ⇒ @ref Detecting with @ref EstimatedSurface.
     */
    class DetectionStateMachine final
    {
      public:
        /**
         * @brief Feed one frame.
         * @param hit    First raycast hit, if any.
         * @param camera Camera of the frame, if any.
         */
        Observation observe (std::optional<host::RaycastHit> hit, std::optional<host::CameraPose> camera)
        {
            DetectionState next = Initializing{};
            if (hit)
            {
                SurfaceKind surface = surfaceOf (*hit);
                next = Detecting{std::move (*hit), std::move (surface), std::move (camera)};
            }

            const bool changed = !(next == state_);
            const bool kindChanged = !sameKind (next, state_);
            state_ = std::move (next);
            return {state_, changed, kindChanged};
        }

        [[nodiscard]] const DetectionState &current () const noexcept { return state_; }

        void reset () noexcept { state_ = Initializing{}; }

      private:
        DetectionState state_{Initializing{}};
    };

} // namespace arfocus::tracking
