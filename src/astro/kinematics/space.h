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

#include "coordinates.h"
#include "frame_transform.h"
#include "kinematicstypes.h"
#include "vector_store.h"

#include "../core/copymove_macros.h"
#include "../core/generational_registry.h"
#include "../core/keyed_vector.h"
#include "../core/math_types.h"

#include <cstddef>
#include <shared_mutex>
#include <vector>

namespace astro::kinematics
{

struct SpaceConfig
{
    /// Maximum number of live entities, 0 for unbounded
    std::size_t slotCapacity    {0};

    /// Allowed deviation of |q| from 1 for headings and rotations, below 1
    double      quatTolerance   {gc_quatTolerance};
};

/**
 * @brief Flat copy of an entity's state, for client state broadcast
 */
struct EntityState
{
    Vector3d    position;
    Vector3d    velocity;
    Quaterniond heading;
    Quaterniond rotation;
};

struct TickFailure
{
    EntityHandle        entity;
    EKinematicsError    error;
};

struct TickReport
{
    std::size_t                 integrated{0};
    std::vector<TickFailure>    failures;

    bool ok() const noexcept { return failures.empty(); }
};

/**
 * @brief One simulation session's kinematic world
 *
 * Owns the VectorStore and the Coordinates of every entity, handing out
 * EntityHandles to the scheduler and game logic. Separate Space instances
 * share nothing.
 *
 * tick() and every mutation hold an exclusive lock; queries hold a shared
 * lock, so readers on other threads wait out the tick's write phase.
 */
class Space
{
public:

    /**
     * @throws std::invalid_argument if config.quatTolerance is not in (0, 1)
     */
    explicit Space(SpaceConfig const& config = {});

    ASTRO_NO_COPY_NO_MOVE(Space)

    /**
     * @throws KinematicsError OutOfCapacity if the store is full,
     *         NonUnitQuaternion for a bad heading or rotation
     */
    [[nodiscard]] EntityHandle spawn_entity(
            Vector3d const&     position    = Vector3d{ZeroInit},
            Vector3d const&     velocity    = Vector3d{ZeroInit},
            Quaterniond const&  heading     = Quaterniond{IdentityInit},
            Quaterniond const&  rotation    = Quaterniond{IdentityInit});

    /**
     * @throws KinematicsError InvalidIndex if the handle is stale
     */
    void despawn_entity(EntityHandle entity);

    /**
     * @brief Integrate every live entity by dt seconds
     *
     * Headings are advanced per entity, then positions in one pass over the
     * store. An entity that fails is listed in the report and left exactly as
     * it was before the tick; the rest are unaffected.
     *
     * @throws std::invalid_argument if dt is not finite
     */
    TickReport tick(double dt);

    [[nodiscard]] bool exists(EntityHandle entity) const;
    [[nodiscard]] std::size_t entity_count() const;

    Vector3d    position(EntityHandle entity) const;
    Vector3d    velocity(EntityHandle entity) const;
    Quaterniond heading(EntityHandle entity) const;
    Quaterniond rotation(EntityHandle entity) const;
    EntityState state_of(EntityHandle entity) const;

    void set_position(EntityHandle entity, Vector3d const& position);
    void set_velocity(EntityHandle entity, Vector3d const& velocity);
    void add_velocity(EntityHandle entity, Vector3d const& deltaV);
    void set_heading(EntityHandle entity, Quaterniond const& heading);
    void set_rotation(EntityHandle entity, Quaterniond const& rotation);

    Spherical   position_spherical(EntityHandle entity) const;
    Spherical   velocity_spherical(EntityHandle entity) const;
    Cylindrical position_cylindrical(EntityHandle entity) const;
    Cylindrical velocity_cylindrical(EntityHandle entity) const;

    void set_position_spherical(EntityHandle entity, Spherical const& position);
    void set_velocity_spherical(EntityHandle entity, Spherical const& velocity);
    void set_position_cylindrical(EntityHandle entity, Cylindrical const& position);
    void set_velocity_cylindrical(EntityHandle entity, Cylindrical const& velocity);

    [[nodiscard]] RelativeSnapshot relative_to(
            EntityHandle subject,
            EntityHandle viewer,
            EFrameMode mode = EFrameMode::Inertial) const;

    [[nodiscard]] Spherical bearing(EntityHandle subject, EntityHandle viewer) const;

    /// Live entities, in ascending ID order
    std::vector<EntityHandle> entities() const;

    SpaceConfig const& config() const noexcept { return m_config; }

private:

    /**
     * @throws KinematicsError InvalidIndex if the handle is stale
     */
    Coordinates const& coords_of(EntityHandle entity) const;
    Coordinates& coords_of(EntityHandle entity);

    SpaceConfig                         m_config;

    mutable std::shared_mutex           m_mutex;

    VectorStore                         m_store;
    GenerationalRegistry<EntityId>      m_entities;
    KeyedVec<EntityId, Coordinates>     m_coordsOf;

}; // class Space

} // namespace astro::kinematics
