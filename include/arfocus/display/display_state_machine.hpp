#pragma once
/**
 * @file   display_state_machine.hpp
 * @brief  Derives the display state from the detection state and the set of
 *         visited planes.
 */

#include <arfocus/display/display_state.hpp>
#include <arfocus/host/types.hpp>
#include <arfocus/tracking/detection_state.hpp>

#include <cstddef>
#include <optional>
#include <unordered_set>
#include <variant>

namespace arfocus::display
{
    /**
     * @brief Display state holder with plane-visitation memory.
     *
     * A plane id yields @ref DisplayState::OnNewPlane the first time it
     * anchors the indicator and @ref DisplayState::OnPlane afterwards, for
     * the whole lifetime of the machine (tracking gaps included).
     */
    class DisplayStateMachine final
    {
      public:
        /**
         * @brief Display state for @p detection, without recording the visit.
         * @param detection Current detection state.
         */
        [[nodiscard]] DisplayState classify (const tracking::DetectionState &detection) const
        {
            const auto *d = std::get_if<tracking::Detecting> (&detection);
            if (!d)
                return DisplayState::Billboard;

            const auto *plane = std::get_if<tracking::KnownPlane> (&d->surface);
            if (!plane)
                return DisplayState::OffPlane;

            return visited_.contains (plane->id) ? DisplayState::OnPlane : DisplayState::OnNewPlane;
        }

        /**
         * @brief Classify @p detection, record a plane visit and commit the result.
         * @return The new state if it differs from the previous one, otherwise empty.
         */
        std::optional<DisplayState> advance (const tracking::DetectionState &detection)
        {
            const DisplayState next = classify (detection); // before recording the visit
            if (const auto *d = std::get_if<tracking::Detecting> (&detection))
                if (const auto *plane = std::get_if<tracking::KnownPlane> (&d->surface))
                    visited_.insert (plane->id);

            if (next == current_)
                return std::nullopt;
            current_ = next;
            return next;
        }

        [[nodiscard]] DisplayState current () const noexcept { return current_; }

        [[nodiscard]] bool hasVisited (const host::PlaneId &id) const { return visited_.contains (id); }

        [[nodiscard]] std::size_t visitedCount () const noexcept { return visited_.size (); }

      private:
        DisplayState current_{DisplayState::Initializing};
        std::unordered_set<host::PlaneId> visited_;
    };

} // namespace arfocus::display
