#pragma once
/**
 * @file   scene_view.hpp
 * @brief  Host AR view: screen geometry, camera and surface raycasting.
 */

#include <arfocus/host/types.hpp>

#include <optional>
#include <vector>

namespace arfocus::host
{
    /**
     * @brief Abstract AR view supplied by the embedder.
     *
     * @ref screenCenter reads view geometry and is only called on the UI
     * thread. @ref currentCamera and @ref raycast are called from the
     * controller's work queue.
     */
    class SceneView
    {
      public:
        SceneView () = default;
        SceneView (const SceneView &) = delete;
        SceneView &operator= (const SceneView &) = delete;
        virtual ~SceneView () = default;

        /// Center of the view bounds.
        [[nodiscard]] virtual ScreenPoint screenCenter () const = 0;

        /// Camera of the current frame; empty before the session delivers one.
        [[nodiscard]] virtual std::optional<CameraPose> currentCamera () const = 0;

        /**
         * @brief Raycast from @p point against estimated and recognized planes.
         * @return Hits ordered nearest first; empty when nothing was hit.
         */
        [[nodiscard]] virtual std::vector<RaycastHit> raycast (ScreenPoint point) const = 0;
    };

} // namespace arfocus::host
