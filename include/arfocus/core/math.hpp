#pragma once
/**
 * @file   math.hpp
 * @brief  3D types of the library (Eigen) and the few helpers built on them.
 *
 * Transforms are rigid (rotation + translation). Their 4×4 matrix is
 * column-major, the layout scene frameworks hand out for world and camera
 * transforms.
 */

#include <arfocus/core/numeric.hpp>

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <cmath>
#include <cstddef>

namespace arfocus::core
{
    using Vec3 = Eigen::Vector3d;        ///< Point or direction [m]
    using Quat = Eigen::Quaterniond;     ///< Unit rotation
    using Transform = Eigen::Isometry3d; ///< Rigid 4×4 transform

    [[nodiscard]] inline double distance (const Vec3 &a, const Vec3 &b) noexcept { return (a - b).norm (); }

    /**
     * @brief Arithmetic mean of a range of points.
     * @param points Iterable of @ref Vec3.
     * @return Mean point, or the origin for an empty range.
     */
    template <class Range> [[nodiscard]] Vec3 mean (const Range &points)
    {
        Vec3 sum = Vec3::Zero ();
        std::size_t n = 0;
        for (const Vec3 &p : points)
        {
            sum += p;
            ++n;
        }
        if (n == 0)
            return sum;
        return sum / static_cast<double> (n);
    }

    /**
     * @brief Rotation of @p angle radians about @p axis.
     * @param angle Rotation angle [rad].
     * @param axis  Rotation axis (need not be unit length); a null axis yields identity.
     */
    [[nodiscard]] inline Quat fromAxisAngle (double angle, const Vec3 &axis)
    {
        const double len = axis.norm ();
        if (len < EPSILON)
            return Quat::Identity ();
        return Quat (Eigen::AngleAxisd (angle, axis / len));
    }

    /// @brief True when @p a and @p b describe the same rotation (q and −q are equal).
    [[nodiscard]] inline bool sameRotation (const Quat &a, const Quat &b, double tol = ROTATION_TOL) noexcept
    {
        return std::fabs (std::fabs (a.dot (b)) - 1.0) <= tol;
    }

    /**
     * @brief Build a rigid transform from a rotation and a translation.
     * @param q Rotation; normalized before use.
     * @param t Translation [m].
     */
    [[nodiscard]] inline Transform makeTransform (const Quat &q, const Vec3 &t)
    {
        Transform m = Transform::Identity ();
        m.linear () = q.normalized ().toRotationMatrix ();
        m.translation () = t;
        return m;
    }

    [[nodiscard]] inline Transform makeTranslation (const Vec3 &t) { return makeTransform (Quat::Identity (), t); }

    /// @brief Rotation part of a rigid transform as a unit quaternion.
    [[nodiscard]] inline Quat orientationOf (const Transform &m) { return Quat (m.linear ()).normalized (); }

} // namespace arfocus::core
