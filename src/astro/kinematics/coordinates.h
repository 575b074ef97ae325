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
#pragma once

#include "kinematicstypes.h"
#include "orientation.h"
#include "spherical.h"
#include "vector_store.h"

#include "../core/math_types.h"

namespace astro::kinematics
{

/**
 * @brief Kinematic state of one entity: a VectorStore slot for position and
 *        velocity, plus its own heading and rotation
 *
 * Position and velocity are never copied in here; every read and write goes
 * through the store passed in, using this entity's slot. Heading and rotation
 * are always unit quaternions.
 *
 * No Coordinates touches another's slot. Looking at one entity from another
 * goes through relative_to() in frame_transform.h.
 */
class Coordinates
{
public:

    Coordinates() = default;

    /**
     * @brief Allocate a slot in rStore and set the initial state
     *
     * @throws KinematicsError OutOfCapacity if rStore is full, NonUnitQuaternion
     *         if heading or rotation are not unit quaternions
     */
    static Coordinates spawn(
            VectorStore&        rStore,
            Vector3d const&     position    = Vector3d{ZeroInit},
            Vector3d const&     velocity    = Vector3d{ZeroInit},
            Quaterniond const&  heading     = Quaterniond{IdentityInit},
            Quaterniond const&  rotation    = Quaterniond{IdentityInit},
            double              tolerance   = gc_quatTolerance);

    /**
     * @brief Free this entity's slot. This Coordinates is unusable afterwards.
     */
    void despawn(VectorStore& rStore);

    SlotHandle slot() const noexcept { return m_slot; }

    Vector3d const& get_position(VectorStore const& store) const { return store.get_position(m_slot); }
    Vector3d const& get_velocity(VectorStore const& store) const { return store.get_velocity(m_slot); }
    Quaterniond const& get_heading() const noexcept { return m_heading; }
    Quaterniond const& get_rotation() const noexcept { return m_rotation; }

    void set_position(VectorStore& rStore, Vector3d const& position) const { rStore.set_position(m_slot, position); }
    void set_velocity(VectorStore& rStore, Vector3d const& velocity) const { rStore.set_velocity(m_slot, velocity); }
    void add_velocity(VectorStore& rStore, Vector3d const& deltaV) const { rStore.add_velocity(m_slot, deltaV); }

    /**
     * @brief Replace the heading. Input within tolerance of unit length is
     *        normalized, anything else throws NonUnitQuaternion.
     */
    void set_heading(Quaterniond const& heading, double tolerance = gc_quatTolerance);

    /// See set_heading
    void set_rotation(Quaterniond const& rotation, double tolerance = gc_quatTolerance);

    /**
     * @brief Advance by dt seconds
     *
     * position += velocity * dt, written to the store. Velocity is untouched.
     * heading = normalize(heading * rotation^dt).
     */
    void integrate(VectorStore& rStore, double dt);

    /**
     * @brief Advance only the heading, for use after the store already
     *        integrated positions in bulk
     *
     * @throws KinematicsError NonUnitQuaternion if the result is not finite;
     *         the heading is left unchanged then
     */
    void integrate_orientation(double dt);

    /// Straight-line prediction of the position after some seconds
    Vector3d position_after(VectorStore const& store, double seconds) const;

    double speed(VectorStore const& store) const { return get_velocity(store).length(); }

    Vector3d facing() const noexcept { return kinematics::facing(m_heading); }

    Spherical position_spherical(VectorStore const& store) const { return to_spherical(get_position(store)); }
    Spherical velocity_spherical(VectorStore const& store) const { return to_spherical(get_velocity(store)); }
    Cylindrical position_cylindrical(VectorStore const& store) const { return to_cylindrical(get_position(store)); }
    Cylindrical velocity_cylindrical(VectorStore const& store) const { return to_cylindrical(get_velocity(store)); }

    void set_position_spherical(VectorStore& rStore, Spherical const& position) const { set_position(rStore, to_cartesian(position)); }
    void set_velocity_spherical(VectorStore& rStore, Spherical const& velocity) const { set_velocity(rStore, to_cartesian(velocity)); }
    void set_position_cylindrical(VectorStore& rStore, Cylindrical const& position) const { set_position(rStore, to_cartesian(position)); }
    void set_velocity_cylindrical(VectorStore& rStore, Cylindrical const& velocity) const { set_velocity(rStore, to_cartesian(velocity)); }

private:

    SlotHandle      m_slot;
    Quaterniond     m_heading   {IdentityInit};
    Quaterniond     m_rotation  {IdentityInit};

}; // class Coordinates

} // namespace astro::kinematics
