/**
 * Open Space Program
 * Copyright © 2019-2023 Open Space Program Project
 *
 * MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/**
 * @file
 * @brief Quaternion helpers shared by Coordinates and FrameTransform
 *
 * Convention, used everywhere in astro::kinematics:
 *
 * Quaternions are multiplied with the Hamilton product. Rotating a vector v by
 * q is q * v * q^-1, so the product a * b rotates by b first, then by a.
 *
 * * Heading:  rotates body-space vectors into universe space. A heading of
 *             identity faces +Y (north) with +Z up.
 * * Rotation: spin per second. dt seconds of spin are applied on the right,
 *             heading * rotation^dt.
 */
#pragma once

#include "../core/math_types.h"

namespace astro::kinematics
{

/// Default allowed deviation of |q| from 1 when setting an orientation
constexpr double gc_quatTolerance = 1.0e-6;

/// Below this |vector part|, a spin quaternion has no usable axis
constexpr double gc_axisEpsilon = 1.0e-12;

/// Body-space forward direction
inline Vector3d const gc_forward{0.0, 1.0, 0.0};

[[nodiscard]] bool is_finite(Quaterniond const& q) noexcept;

/**
 * @return true if |q| is within tolerance of 1
 */
[[nodiscard]] bool is_unit(Quaterniond const& q, double tolerance = gc_quatTolerance) noexcept;

/**
 * @brief Validate and normalize an orientation
 *
 * @throws KinematicsError NonUnitQuaternion if q is not finite or |q| deviates
 *                         from 1 beyond tolerance
 */
[[nodiscard]] Quaterniond normalize_checked(Quaterniond const& q, double tolerance = gc_quatTolerance);

/**
 * @brief Make a rotor turning by an angle about an axis
 *
 * @param axis [in] Any non-zero vector, normalized internally
 *
 * @throws std::invalid_argument if the axis is zero or not finite
 */
[[nodiscard]] Quaterniond rotor(Radd angle, Vector3d const& axis);

/**
 * @brief Scale a per-second spin quaternion to a time interval
 *
 * The spin's rotation angle (0 to 360 degrees per second) is multiplied by dt
 * about the same axis. Identity spins, and dt = 0, give identity.
 */
[[nodiscard]] Quaterniond quat_from_angular_velocity(Quaterniond const& rotation, double dt) noexcept;

/**
 * @return Angular velocity vector (axis * radians per second) of a spin quaternion
 */
[[nodiscard]] Vector3d angular_velocity_vector(Quaterniond const& rotation) noexcept;

/**
 * @return Rotation taking 'from' to 'to', i.e. from^-1 * to
 */
[[nodiscard]] Quaterniond quat_difference(Quaterniond const& from, Quaterniond const& to) noexcept;

/**
 * @return v rotated by q
 */
[[nodiscard]] Vector3d rotate(Vector3d const& v, Quaterniond const& q) noexcept;

/**
 * @return v rotated by the inverse of q, i.e. v seen from a frame oriented as q
 */
[[nodiscard]] Vector3d inverse_rotate(Vector3d const& v, Quaterniond const& q) noexcept;

/**
 * @return Unit vector in universe space that a heading points toward
 */
[[nodiscard]] Vector3d facing(Quaterniond const& heading) noexcept;

} // namespace astro::kinematics
