#pragma once
/**
 * @file   display_state.hpp
 * @brief  User-facing display state of the focus indicator.
 */

#include <string_view>

namespace arfocus::display
{
    /**
     * @enum DisplayState
     * @brief What the indicator communicates to the user.
     */
    enum class DisplayState
    {
        Initializing, ///< Not set up yet
        Billboard,    ///< No surface tracked; follows the camera
        OffPlane,     ///< On an estimated, unclassified surface
        OnNewPlane,   ///< On a plane anchoring the indicator for the first time
        OnPlane       ///< On a plane visited before
    };

    [[nodiscard]] constexpr std::string_view toString (DisplayState s) noexcept
    {
        switch (s)
        {
        case DisplayState::Initializing:
            return "Initializing";
        case DisplayState::Billboard:
            return "Billboard";
        case DisplayState::OffPlane:
            return "Off plane";
        case DisplayState::OnNewPlane:
            return "On new plane";
        case DisplayState::OnPlane:
            return "On plane";
        }
        return "Unknown";
    }

    /// @brief True for both on-plane states.
    [[nodiscard]] constexpr bool isOnPlane (DisplayState s) noexcept { return s == DisplayState::OnNewPlane || s == DisplayState::OnPlane; }

} // namespace arfocus::display
