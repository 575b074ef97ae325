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
 * @brief Conversions between Cartesian vectors and player-facing bearings
 *
 * Axes: X = east, Y = north, Z = up (right-handed, like a top-down map).
 *
 * Spherical (rho, theta, phi):
 * * rho:   distance
 * * theta: elevation above the XY plane, -90 to 90 degrees
 * * phi:   azimuth clockwise from north (+Y toward +X), -180 to 180 degrees
 *
 * Cylindrical (radius, phi, height):
 * * radius: distance from the Z axis
 * * phi:    azimuth, same as spherical
 * * height: Z
 *
 * A vector with no direction (the origin, or straight up/down for azimuth)
 * reports 0 for the undefined angles. This is defined behaviour, not an error.
 */
#pragma once

#include "../core/math_types.h"

namespace astro::kinematics
{

struct Spherical
{
    double  rho{0.0};
    Degd    theta{0.0};
    Degd    phi{0.0};
};

struct Cylindrical
{
    double  radius{0.0};
    Degd    phi{0.0};
    double  height{0.0};
};

[[nodiscard]] Spherical to_spherical(Vector3d const& v) noexcept;

[[nodiscard]] Vector3d to_cartesian(Spherical const& s) noexcept;

[[nodiscard]] Cylindrical to_cylindrical(Vector3d const& v) noexcept;

[[nodiscard]] Vector3d to_cartesian(Cylindrical const& c) noexcept;

/**
 * @brief Azimuth of a vector's horizontal component, clockwise from north
 */
[[nodiscard]] Degd azimuth(Vector3d const& v) noexcept;

} // namespace astro::kinematics
