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
#include "vector_store.h"

#include <string>

using namespace astro;
using namespace astro::kinematics;

SlotHandle VectorStore::allocate()
{
    if (m_capacityLimit != 0 && m_slots.size() >= m_capacityLimit)
    {
        throw KinematicsError(EKinematicsError::OutOfCapacity,
                              "vector store is full at " + std::to_string(m_capacityLimit) + " slots");
    }

    SlotHandle const handle = m_slots.create();

    std::size_t const capacity = m_slots.capacity();
    if (m_position.size() < capacity)
    {
        m_position.resize(capacity, Vector3d{ZeroInit});
        m_velocity.resize(capacity, Vector3d{ZeroInit});
    }

    // Reused slots still hold the previous occupant's vectors
    m_position[handle.id] = Vector3d{ZeroInit};
    m_velocity[handle.id] = Vector3d{ZeroInit};

    return handle;
}

void VectorStore::free(SlotHandle const handle)
{
    if ( ! m_slots.remove(handle) )
    {
        throw KinematicsError(EKinematicsError::InvalidIndex,
                              "free of stale slot " + std::to_string(handle.id.value));
    }
}

void VectorStore::check_live(SlotHandle const handle) const
{
    if ( ! m_slots.is_live(handle) )
    {
        throw KinematicsError(EKinematicsError::InvalidIndex,
                              "slot " + std::to_string(handle.id.value)
                              + " generation " + std::to_string(handle.generation)
                              + " is not allocated");
    }
}

Vector3d const& VectorStore::get_position(SlotHandle const handle) const
{
    check_live(handle);
    return m_position[handle.id];
}

Vector3d const& VectorStore::get_velocity(SlotHandle const handle) const
{
    check_live(handle);
    return m_velocity[handle.id];
}

void VectorStore::set_position(SlotHandle const handle, Vector3d const& position)
{
    check_live(handle);
    m_position[handle.id] = position;
}

void VectorStore::set_velocity(SlotHandle const handle, Vector3d const& velocity)
{
    check_live(handle);
    m_velocity[handle.id] = velocity;
}

void VectorStore::add_velocity(SlotHandle const handle, Vector3d const& deltaV)
{
    check_live(handle);
    m_velocity[handle.id] += deltaV;
}

void VectorStore::integrate_positions(double const dt) noexcept
{
    for (SlotId const slot : m_slots.ids())
    {
        m_position[slot] += m_velocity[slot] * dt;
    }
}
