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
#include "spherical.h"

#include <Magnum/Math/Functions.h>

#include <algorithm>
#include <cmath>

using namespace astro;
using namespace astro::kinematics;

namespace Math = Magnum::Math;

Degd astro::kinematics::azimuth(Vector3d const& v) noexcept
{
    // atan2(+-0, -0) would give 180 degrees for a purely vertical vector
    if (v.x() == 0.0 && v.y() == 0.0)
    {
        return Degd{0.0};
    }
    return Degd{Radd{std::atan2(v.x(), v.y())}};
}

Spherical astro::kinematics::to_spherical(Vector3d const& v) noexcept
{
    double const rho = v.length();
    if ( ! (rho > 0.0) )
    {
        return {};
    }

    // Rounding can push z/rho slightly past +-1
    double const sinElev = std::clamp(v.z() / rho, -1.0, 1.0);

    return {
        .rho   = rho,
        .theta = Degd{Radd{std::asin(sinElev)}},
        .phi   = azimuth(v)
    };
}

Vector3d astro::kinematics::to_cartesian(Spherical const& s) noexcept
{
    double const cosElev = Math::cos(s.theta);
    return {
        s.rho * cosElev * Math::sin(s.phi),
        s.rho * cosElev * Math::cos(s.phi),
        s.rho * Math::sin(s.theta)
    };
}

Cylindrical astro::kinematics::to_cylindrical(Vector3d const& v) noexcept
{
    return {
        .radius = std::sqrt(v.x() * v.x() + v.y() * v.y()),
        .phi    = azimuth(v),
        .height = v.z()
    };
}

Vector3d astro::kinematics::to_cartesian(Cylindrical const& c) noexcept
{
    return {
        c.radius * Math::sin(c.phi),
        c.radius * Math::cos(c.phi),
        c.height
    };
}
