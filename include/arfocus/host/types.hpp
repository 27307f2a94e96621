#pragma once
/**
 * @file   types.hpp
 * @brief  Value types exchanged with the host AR framework: camera poses,
 *         raycast hits and screen points.
 */

#include <arfocus/core/math.hpp>

#include <cmath>
#include <optional>
#include <string>

namespace arfocus::host
{
    /// Opaque identifier of a plane anchor recognized by the host.
    using PlaneId = std::string;

    /// Point in view coordinates [pt].
    struct ScreenPoint
    {
        double x{};
        double y{};

        friend constexpr bool operator== (const ScreenPoint &, const ScreenPoint &) = default;
    };

    /**
     * @brief Quality of the host's world tracking.
     *
     * Only @c Normal allows the indicator to anchor to the world.
     */
    enum class TrackingQuality
    {
        NotAvailable,
        Limited,
        Normal
    };

    /**
     * @struct CameraPose
     * @brief  Camera snapshot of one frame.
     */
    struct CameraPose
    {
        core::Transform transform = core::Transform::Identity (); ///< Camera-to-world transform
        core::Vec3 eulerAngles = core::Vec3::Zero ();             ///< (pitch, yaw, roll) [rad]
        TrackingQuality tracking{TrackingQuality::Normal};

        /// @brief Absolute camera pitch [rad].
        [[nodiscard]] double tilt () const noexcept { return std::fabs (eulerAngles.x ()); }

        friend bool operator== (const CameraPose &a, const CameraPose &b)
        {
            return a.transform.matrix () == b.transform.matrix () && a.eulerAngles == b.eulerAngles && a.tracking == b.tracking;
        }
    };

    /**
     * @struct RaycastHit
     * @brief  Intersection of a screen ray with the host's model of the environment.
     */
    struct RaycastHit
    {
        core::Transform worldTransform = core::Transform::Identity (); ///< Hit pose; rotation aligned with the surface
        std::optional<PlaneId> planeId{};                              ///< Set when the hit lies on a recognized plane anchor

        friend bool operator== (const RaycastHit &a, const RaycastHit &b)
        {
            return a.worldTransform.matrix () == b.worldTransform.matrix () && a.planeId == b.planeId;
        }
    };

} // namespace arfocus::host
