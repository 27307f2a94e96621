#pragma once
/**
 * @file   scene_node.hpp
 * @brief  Host scene-graph node that carries the focus indicator.
 */

#include <arfocus/core/math.hpp>

#include <functional>

namespace arfocus::skin
{
    class IndicatorSkin;
}

namespace arfocus::host
{
    /// Where the node currently hangs in the host scene graph.
    enum class NodeParent
    {
        Detached,
        SceneRoot, ///< World-anchored mode
        Camera     ///< Billboard mode
    };

    /// Invoked by the host once an animated change has finished.
    using Completion = std::function<void ()>;

    /**
     * @brief Abstract node of the host scene graph.
     *
     * Implemented by the embedder on top of its rendering framework. The
     * controller only calls it from its serial work queue. Completions may be
     * invoked on any thread, synchronously included.
     */
    class SceneNode
    {
      public:
        SceneNode () = default;
        SceneNode (const SceneNode &) = delete;
        SceneNode &operator= (const SceneNode &) = delete;
        virtual ~SceneNode () = default;

        /*────────────── Scene-graph placement ──────────────*/

        [[nodiscard]] virtual NodeParent parent () const = 0;

        /// Move the node under @p parent, keeping its local transform.
        virtual void reparent (NodeParent parent) = 0;

        /*────────────── Transform (local to the parent) ──────────────*/

        virtual void setTransform (const core::Transform &transform) = 0;
        virtual void setPosition (const core::Vec3 &position) = 0;
        virtual void setScale (const core::Vec3 &scale) = 0;

        /**
         * @brief Rotate the node, animated over @p duration seconds.
         * @param onComplete Called when the rotation has finished; may be empty.
         */
        virtual void setOrientation (const core::Quat &orientation, double duration, Completion onComplete) = 0;

        /*────────────── Indicator content ──────────────*/

        virtual void addContent (skin::IndicatorSkin &content) = 0;
        virtual void removeContent (skin::IndicatorSkin &content) = 0;

        /// Pitch of the content about its local X axis [rad]; −π/2 lies flat on a surface.
        virtual void setContentPitch (double radians) = 0;

        /// Uniform scale of the content (the indicator's nominal size).
        virtual void setContentScale (double scale) = 0;

        /*────────────── Appearance ──────────────*/

        /// Animate opacity to @p opacity over @p duration seconds.
        virtual void fade (double opacity, double duration, Completion onComplete) = 0;
        virtual void setOpacity (double opacity) = 0;
        virtual void setHidden (bool hidden) = 0;

        /// Draw the node (and its children) above all other scene content.
        virtual void setRenderOnTop (bool onTop) = 0;
    };

} // namespace arfocus::host
