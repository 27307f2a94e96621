#pragma once
/**
 * @file   indicator_skin.hpp
 * @brief  Pluggable visual representation of the focus indicator.
 */

#include <arfocus/display/display_state.hpp>

#include <boost/asio/any_io_executor.hpp>

namespace arfocus::skin
{
    /**
     * @brief Rendering strategy observed by the focus controller.
     *
     * A skin owns its geometry, materials and state-specific animation. The
     * controller only tells it which state to show; every call arrives on
     * the controller's work queue.
     */
    class IndicatorSkin
    {
      public:
        IndicatorSkin () = default;
        IndicatorSkin (const IndicatorSkin &) = delete;
        IndicatorSkin &operator= (const IndicatorSkin &) = delete;
        virtual ~IndicatorSkin () = default;

        /**
         * @brief Build the visual geometry.
         * @param updateQueue Serial queue the controller mutates the scene on;
         *                    skins schedule their own scene work there.
         *
         * Called once, by the controller, before the skin is attached.
         */
        virtual void setupGeometry (const boost::asio::any_io_executor &updateQueue) = 0;

        /// Show @p state; only called when the state actually changes.
        virtual void setDisplayState (display::DisplayState state) = 0;

        [[nodiscard]] virtual display::DisplayState displayState () const noexcept = 0;

        /// Nominal edge length of the indicator [m].
        [[nodiscard]] virtual double size () const noexcept = 0;
    };

} // namespace arfocus::skin
