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
#include "orientation.h"
#include "kinematicstypes.h"

#include <cmath>
#include <stdexcept>
#include <string>

using namespace astro;
using namespace astro::kinematics;

bool astro::kinematics::is_finite(Quaterniond const& q) noexcept
{
    Vector3d const& v = q.vector();
    return    std::isfinite(v.x()) && std::isfinite(v.y()) && std::isfinite(v.z())
           && std::isfinite(q.scalar());
}

bool astro::kinematics::is_unit(Quaterniond const& q, double const tolerance) noexcept
{
    return is_finite(q) && std::abs(q.length() - 1.0) <= tolerance;
}

Quaterniond astro::kinematics::normalize_checked(Quaterniond const& q, double const tolerance)
{
    // A zero quaternion has no direction to normalize to, whatever the tolerance
    if ( ! is_unit(q, tolerance) || ! (q.length() > 0.0) )
    {
        throw KinematicsError(EKinematicsError::NonUnitQuaternion,
                              "quaternion length " + std::to_string(q.length())
                              + " exceeds tolerance " + std::to_string(tolerance));
    }
    return q.normalized();
}

Quaterniond astro::kinematics::rotor(Radd const angle, Vector3d const& axis)
{
    double const len = axis.length();
    if ( ! (len > gc_axisEpsilon) || ! std::isfinite(len) )
    {
        throw std::invalid_argument("rotor axis has no direction");
    }
    return Quaterniond::rotation(angle, axis / len);
}

Quaterniond astro::kinematics::quat_from_angular_velocity(Quaterniond const& rotation, double const dt) noexcept
{
    double const sinHalf = rotation.vector().length();
    if (sinHalf < gc_axisEpsilon || dt == 0.0)
    {
        return Quaterniond{IdentityInit};
    }

    // atan2 stays accurate near 0 and 360 degrees, where acos(w) does not
    double const angle = 2.0 * std::atan2(sinHalf, rotation.scalar());
    return Quaterniond::rotation(Radd{angle * dt}, rotation.vector() / sinHalf);
}

Vector3d astro::kinematics::angular_velocity_vector(Quaterniond const& rotation) noexcept
{
    double const sinHalf = rotation.vector().length();
    if (sinHalf < gc_axisEpsilon)
    {
        return Vector3d{ZeroInit};
    }
    double const angle = 2.0 * std::atan2(sinHalf, rotation.scalar());
    return rotation.vector() * (angle / sinHalf);
}

Quaterniond astro::kinematics::quat_difference(Quaterniond const& from, Quaterniond const& to) noexcept
{
    return from.conjugated() * to;
}

Vector3d astro::kinematics::rotate(Vector3d const& v, Quaterniond const& q) noexcept
{
    return q.transformVector(v);
}

Vector3d astro::kinematics::inverse_rotate(Vector3d const& v, Quaterniond const& q) noexcept
{
    return q.inverted().transformVector(v);
}

Vector3d astro::kinematics::facing(Quaterniond const& heading) noexcept
{
    return heading.transformVector(gc_forward).normalized();
}
