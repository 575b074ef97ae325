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
#include "frame_transform.h"
#include "orientation.h"

#include <Magnum/Math/Vector3.h>

using namespace astro;
using namespace astro::kinematics;

RelativeSnapshot astro::kinematics::relative_to(
        VectorStore const&  store,
        Coordinates const&  subject,
        Coordinates const&  viewer,
        EFrameMode const    mode)
{
    Quaterniond const& viewHeading = viewer.get_heading();
    Quaterniond const  viewInverse = viewHeading.conjugated();

    Vector3d const position = inverse_rotate(subject.get_position(store) - viewer.get_position(store), viewHeading);
    Vector3d       velocity = inverse_rotate(subject.get_velocity(store) - viewer.get_velocity(store), viewHeading);

    Quaterniond const heading = (viewInverse * subject.get_heading()).normalized();

    // Spins are body-space (heading * rotation^dt). The viewer's spin is moved
    // into the subject's body frame through the relative heading, then taken
    // out of the subject's own spin. Order matters, products don't commute.
    Quaterniond const viewerSpin = heading.conjugated() * viewer.get_rotation() * heading;
    Quaterniond const rotation   = quat_difference(viewerSpin, subject.get_rotation()).normalized();

    if (mode == EFrameMode::Rotating)
    {
        velocity -= Magnum::Math::cross(angular_velocity_vector(viewer.get_rotation()), position);
    }

    return {position, velocity, heading, rotation};
}

Spherical astro::kinematics::bearing(
        VectorStore const&  store,
        Coordinates const&  subject,
        Coordinates const&  viewer)
{
    return to_spherical(relative_to(store, subject, viewer).position());
}
