#pragma once
/**
 * @file   detection_state.hpp
 * @brief  Raw per-frame detection outcome as a tagged union.
 */

#include <arfocus/host/types.hpp>

#include <optional>
#include <variant>

namespace arfocus::tracking
{
    /// Hit on a surface the host estimated but has not classified as a plane.
    struct EstimatedSurface
    {
        friend bool operator== (const EstimatedSurface &, const EstimatedSurface &) = default;
    };

    /// Hit on a recognized plane anchor.
    struct KnownPlane
    {
        host::PlaneId id;

        friend bool operator== (const KnownPlane &, const KnownPlane &) = default;
    };

    using SurfaceKind = std::variant<EstimatedSurface, KnownPlane>;

    /// No valid tracking data.
    struct Initializing
    {
        friend bool operator== (const Initializing &, const Initializing &) = default;
    };

    /// A surface was hit this frame.
    struct Detecting
    {
        host::RaycastHit hit;
        SurfaceKind surface;
        std::optional<host::CameraPose> camera;

        friend bool operator== (const Detecting &, const Detecting &) = default;
    };

    using DetectionState = std::variant<Initializing, Detecting>;

    /// @brief Classify a raycast hit by the anchor it lies on.
    [[nodiscard]] inline SurfaceKind surfaceOf (const host::RaycastHit &hit)
    {
        if (hit.planeId)
            return KnownPlane{*hit.planeId};
        return EstimatedSurface{};
    }

    [[nodiscard]] inline bool isDetecting (const DetectionState &s) noexcept { return std::holds_alternative<Detecting> (s); }

    /**
     * @brief Whether two states are of the same kind.
     *
     * Kinds are: initializing, estimated surface, and one kind per plane id.
     * Hit poses and cameras are ignored.
     */
    [[nodiscard]] inline bool sameKind (const DetectionState &a, const DetectionState &b)
    {
        const auto *da = std::get_if<Detecting> (&a);
        const auto *db = std::get_if<Detecting> (&b);
        if (!da || !db)
            return !da && !db;
        return da->surface == db->surface;
    }

} // namespace arfocus::tracking
