#pragma once
/**
 * @file   focus_observer.hpp
 * @brief  Callback interface for display-state changes.
 */

#include <arfocus/display/display_state.hpp>

namespace arfocus::controller
{
    class FocusController;
}

namespace arfocus::display
{
    /**
     * @brief Receives confirmed display-state changes.
     *
     * Always invoked on the UI thread. The controller keeps a non-owning
     * pointer; the observer must outlive its registration.
     */
    class FocusObserver
    {
      public:
        FocusObserver () = default;
        FocusObserver (const FocusObserver &) = default;
        FocusObserver &operator= (const FocusObserver &) = default;
        virtual ~FocusObserver () = default;

        virtual void onDisplayStateChanged (controller::FocusController &controller, DisplayState state) = 0;
    };

} // namespace arfocus::display
