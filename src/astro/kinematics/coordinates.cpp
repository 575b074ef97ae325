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
#include "coordinates.h"

#include <utility>

using namespace astro;
using namespace astro::kinematics;

Coordinates Coordinates::spawn(
        VectorStore&        rStore,
        Vector3d const&     position,
        Vector3d const&     velocity,
        Quaterniond const&  heading,
        Quaterniond const&  rotation,
        double const        tolerance)
{
    // Validate before allocating so a bad orientation doesn't leak a slot
    Coordinates out;
    out.m_heading   = normalize_checked(heading,  tolerance);
    out.m_rotation  = normalize_checked(rotation, tolerance);
    out.m_slot      = rStore.allocate();

    rStore.set_position(out.m_slot, position);
    rStore.set_velocity(out.m_slot, velocity);

    return out;
}

void Coordinates::despawn(VectorStore& rStore)
{
    rStore.free(std::exchange(m_slot, {}));
}

void Coordinates::set_heading(Quaterniond const& heading, double const tolerance)
{
    m_heading = normalize_checked(heading, tolerance);
}

void Coordinates::set_rotation(Quaterniond const& rotation, double const tolerance)
{
    m_rotation = normalize_checked(rotation, tolerance);
}

void Coordinates::integrate(VectorStore& rStore, double const dt)
{
    Vector3d const position = rStore.get_position(m_slot);
    Vector3d const velocity = rStore.get_velocity(m_slot);

    integrate_orientation(dt);

    rStore.set_position(m_slot, position + velocity * dt);
}

void Coordinates::integrate_orientation(double const dt)
{
    Quaterniond const next = (m_heading * quat_from_angular_velocity(m_rotation, dt)).normalized();

    if ( ! is_finite(next) )
    {
        throw KinematicsError(EKinematicsError::NonUnitQuaternion, "heading integration diverged");
    }

    m_heading = next;
}

Vector3d Coordinates::position_after(VectorStore const& store, double const seconds) const
{
    return get_position(store) + get_velocity(store) * seconds;
}
