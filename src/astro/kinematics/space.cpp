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
#include "space.h"

#include "../util/logging.h"

#include <cmath>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

using namespace astro;
using namespace astro::kinematics;

Space::Space(SpaceConfig const& config)
 : m_config{config}
 , m_store{config.slotCapacity}
{
    // At 1 or more, a zero quaternion would count as unit length
    if ( ! (config.quatTolerance > 0.0 && config.quatTolerance < 1.0) )
    {
        throw std::invalid_argument("quaternion tolerance must be in (0, 1), got "
                                    + std::to_string(config.quatTolerance));
    }
}

EntityHandle Space::spawn_entity(
        Vector3d const&     position,
        Vector3d const&     velocity,
        Quaterniond const&  heading,
        Quaterniond const&  rotation)
{
    std::unique_lock lock{m_mutex};

    Coordinates coords = Coordinates::spawn(m_store, position, velocity, heading, rotation, m_config.quatTolerance);

    EntityHandle const entity = m_entities.create();
    if (m_coordsOf.size() < m_entities.capacity())
    {
        m_coordsOf.resize(m_entities.capacity());
    }
    m_coordsOf[entity.id] = coords;

    ASTRO_LOG_DEBUG("Spawned entity {} (gen {}) in slot {}",
                    entity.id.value, entity.generation, coords.slot().id.value);
    return entity;
}

void Space::despawn_entity(EntityHandle const entity)
{
    std::unique_lock lock{m_mutex};

    Coordinates &rCoords = coords_of(entity);
    SlotId const slot = rCoords.slot().id;

    rCoords.despawn(m_store);
    m_entities.remove(entity);

    ASTRO_LOG_DEBUG("Despawned entity {} (gen {}), freed slot {}",
                    entity.id.value, entity.generation, slot.value);
}

TickReport Space::tick(double const dt)
{
    if ( ! std::isfinite(dt) )
    {
        throw std::invalid_argument("tick interval must be finite, got " + std::to_string(dt));
    }

    std::unique_lock lock{m_mutex};

    TickReport report;

    struct Held
    {
        SlotHandle  slot;
        Vector3d    position;
    };
    std::vector<Held> held;

    for (EntityId const id : m_entities.ids())
    {
        Coordinates &rCoords = m_coordsOf[id];
        try
        {
            rCoords.integrate_orientation(dt);
            ++ report.integrated;
        }
        catch (KinematicsError const& e)
        {
            // Failed entities keep their whole state from before the tick
            held.push_back({rCoords.slot(), rCoords.get_position(m_store)});

            EntityHandle const entity = m_entities.handle_of(id);
            ASTRO_LOG_WARN("Entity {} failed to integrate: {}", id.value, e.what());
            report.failures.push_back({entity, e.kind()});
        }
    }

    m_store.integrate_positions(dt);

    for (Held const& rHeld : held)
    {
        m_store.set_position(rHeld.slot, rHeld.position);
    }

    return report;
}

bool Space::exists(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return m_entities.is_live(entity);
}

std::size_t Space::entity_count() const
{
    std::shared_lock lock{m_mutex};
    return m_entities.size();
}

Coordinates const& Space::coords_of(EntityHandle const entity) const
{
    if ( ! m_entities.is_live(entity) )
    {
        throw KinematicsError(EKinematicsError::InvalidIndex,
                              "entity " + std::to_string(entity.id.value)
                              + " generation " + std::to_string(entity.generation)
                              + " does not exist");
    }
    return m_coordsOf[entity.id];
}

Coordinates& Space::coords_of(EntityHandle const entity)
{
    return const_cast<Coordinates&>(std::as_const(*this).coords_of(entity));
}

Vector3d Space::position(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).get_position(m_store);
}

Vector3d Space::velocity(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).get_velocity(m_store);
}

Quaterniond Space::heading(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).get_heading();
}

Quaterniond Space::rotation(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).get_rotation();
}

EntityState Space::state_of(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    Coordinates const& coords = coords_of(entity);
    return {
        .position = coords.get_position(m_store),
        .velocity = coords.get_velocity(m_store),
        .heading  = coords.get_heading(),
        .rotation = coords.get_rotation()
    };
}

void Space::set_position(EntityHandle const entity, Vector3d const& position)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_position(m_store, position);
}

void Space::set_velocity(EntityHandle const entity, Vector3d const& velocity)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_velocity(m_store, velocity);
}

void Space::add_velocity(EntityHandle const entity, Vector3d const& deltaV)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).add_velocity(m_store, deltaV);
}

void Space::set_heading(EntityHandle const entity, Quaterniond const& heading)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_heading(heading, m_config.quatTolerance);
}

void Space::set_rotation(EntityHandle const entity, Quaterniond const& rotation)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_rotation(rotation, m_config.quatTolerance);
}

Spherical Space::position_spherical(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).position_spherical(m_store);
}

Spherical Space::velocity_spherical(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).velocity_spherical(m_store);
}

Cylindrical Space::position_cylindrical(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).position_cylindrical(m_store);
}

Cylindrical Space::velocity_cylindrical(EntityHandle const entity) const
{
    std::shared_lock lock{m_mutex};
    return coords_of(entity).velocity_cylindrical(m_store);
}

void Space::set_position_spherical(EntityHandle const entity, Spherical const& position)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_position_spherical(m_store, position);
}

void Space::set_velocity_spherical(EntityHandle const entity, Spherical const& velocity)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_velocity_spherical(m_store, velocity);
}

void Space::set_position_cylindrical(EntityHandle const entity, Cylindrical const& position)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_position_cylindrical(m_store, position);
}

void Space::set_velocity_cylindrical(EntityHandle const entity, Cylindrical const& velocity)
{
    std::unique_lock lock{m_mutex};
    coords_of(entity).set_velocity_cylindrical(m_store, velocity);
}

RelativeSnapshot Space::relative_to(EntityHandle const subject, EntityHandle const viewer, EFrameMode const mode) const
{
    std::shared_lock lock{m_mutex};
    return kinematics::relative_to(m_store, coords_of(subject), coords_of(viewer), mode);
}

Spherical Space::bearing(EntityHandle const subject, EntityHandle const viewer) const
{
    std::shared_lock lock{m_mutex};
    return kinematics::bearing(m_store, coords_of(subject), coords_of(viewer));
}

std::vector<EntityHandle> Space::entities() const
{
    std::shared_lock lock{m_mutex};

    std::vector<EntityHandle> out;
    out.reserve(m_entities.size());
    for (EntityId const id : m_entities.ids())
    {
        out.push_back(m_entities.handle_of(id));
    }
    return out;
}
