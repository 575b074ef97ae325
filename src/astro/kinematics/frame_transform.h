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
 * @brief Measure one entity's kinematic state from another entity's frame
 */
#pragma once

#include "coordinates.h"

#include "../core/math_types.h"

#include <cstdint>

namespace astro::kinematics
{

enum class EFrameMode : std::uint8_t
{
    /// Translate and rotate into the viewer's frame. The viewer's own spin is
    /// not taken out of the relative velocity.
    Inertial,

    /// Inertial, then also subtract omega x r, the apparent motion caused by
    /// the viewer spinning. omega is V.rotation as an angular velocity, which
    /// is already in the viewer's body frame.
    Rotating
};

/**
 * @brief State of a subject as measured by a viewer, detached from any store
 */
class RelativeSnapshot
{
public:

    constexpr RelativeSnapshot(
            Vector3d const&     position,
            Vector3d const&     velocity,
            Quaterniond const&  heading,
            Quaterniond const&  rotation) noexcept
     : m_position{position}
     , m_velocity{velocity}
     , m_heading{heading}
     , m_rotation{rotation}
    { }

    constexpr Vector3d const& position() const noexcept { return m_position; }
    constexpr Vector3d const& velocity() const noexcept { return m_velocity; }
    constexpr Quaterniond const& heading() const noexcept { return m_heading; }
    constexpr Quaterniond const& rotation() const noexcept { return m_rotation; }

private:

    Vector3d    m_position;
    Vector3d    m_velocity;
    Quaterniond m_heading;
    Quaterniond m_rotation;

}; // class RelativeSnapshot

/**
 * @brief Compute the subject's state as seen by an observer sitting at the
 *        viewer, facing the same way as the viewer
 *
 * With Vh the viewer's heading:
 *
 * position = Vh^-1 (S.position - V.position)
 * velocity = Vh^-1 (S.velocity - V.velocity)
 * heading  = Vh^-1 * S.heading
 *
 * Spins are body-space, so the relative rotation is kept in the subject's body
 * frame, same as S.rotation. The viewer's spin is brought there through the
 * relative heading, then taken out of the subject's:
 *
 * v        = heading^-1 * V.rotation * heading
 * rotation = v^-1 * S.rotation
 *
 * heading * rotation is then the relative heading one second later whenever
 * only one of the two spins.
 *
 * Neither subject nor viewer is modified. relative_to(store, C, C) gives zero
 * position and velocity, and identity heading and rotation.
 *
 * @throws KinematicsError InvalidIndex if either slot is stale
 */
[[nodiscard]] RelativeSnapshot relative_to(
        VectorStore const&  store,
        Coordinates const&  subject,
        Coordinates const&  viewer,
        EFrameMode          mode = EFrameMode::Inertial);

/**
 * @return Bearing of the subject from the viewer's point of view
 */
[[nodiscard]] Spherical bearing(
        VectorStore const&  store,
        Coordinates const&  subject,
        Coordinates const&  viewer);

} // namespace astro::kinematics
