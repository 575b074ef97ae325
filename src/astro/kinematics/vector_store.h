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

#include "../core/copymove_macros.h"
#include "../core/keyed_vector.h"
#include "../core/math_types.h"

#include <cstddef>

namespace astro::kinematics
{

/**
 * @brief Contiguous storage of absolute positions and velocities, one slot per
 *        simulated entity
 *
 * Positions and velocities live in two parallel arrays indexed by SlotId, so
 * the per-tick integration pass walks memory linearly. Entities never hold
 * pointers into the arrays, only a SlotHandle; a handle to a freed slot is
 * rejected with InvalidIndex even after the slot is reused.
 *
 * Not a singleton. Every simulation session constructs and owns its own.
 */
class VectorStore
{
public:

    /**
     * @param capacity [in] Maximum number of live slots, 0 for unbounded
     */
    explicit VectorStore(std::size_t capacity = 0) noexcept
     : m_capacityLimit{capacity}
    { }

    ASTRO_MOVE_ONLY_CTOR_ASSIGN(VectorStore)

    /**
     * @brief Allocate a slot, zero position and velocity
     *
     * @throws KinematicsError OutOfCapacity if the store is bounded and full
     */
    [[nodiscard]] SlotHandle allocate();

    /**
     * @brief Release a slot for reuse. Invalidates all handles to it.
     *
     * @throws KinematicsError InvalidIndex if the handle is stale
     */
    void free(SlotHandle handle);

    [[nodiscard]] bool exists(SlotHandle const handle) const noexcept
    {
        return m_slots.is_live(handle);
    }

    Vector3d const& get_position(SlotHandle handle) const;
    Vector3d const& get_velocity(SlotHandle handle) const;

    void set_position(SlotHandle handle, Vector3d const& position);
    void set_velocity(SlotHandle handle, Vector3d const& velocity);

    /// Add an impulse (change in velocity) to a slot
    void add_velocity(SlotHandle handle, Vector3d const& deltaV);

    /**
     * @brief Move every live slot along its velocity: position += velocity * dt
     *
     * Single pass over the contiguous arrays. Each slot is written exactly once
     * and reads only itself.
     */
    void integrate_positions(double dt) noexcept;

    /**
     * @brief Call func(SlotHandle, Vector3d& position, Vector3d& velocity) for
     *        every live slot, in slot order
     */
    template <typename FUNC_T>
    void for_each_live(FUNC_T&& func);

    template <typename FUNC_T>
    void for_each_live(FUNC_T&& func) const;

    /// Number of live slots
    std::size_t size() const noexcept { return m_slots.size(); }

    /// Maximum number of live slots, 0 if unbounded
    std::size_t capacity_limit() const noexcept { return m_capacityLimit; }

    /// Number of slots with storage allocated, live or not
    std::size_t capacity() const noexcept { return m_position.size(); }

private:

    /**
     * @throws KinematicsError InvalidIndex if the handle is stale
     */
    void check_live(SlotHandle handle) const;

    GenerationalRegistry<SlotId>    m_slots;
    KeyedVec<SlotId, Vector3d>      m_position;
    KeyedVec<SlotId, Vector3d>      m_velocity;
    std::size_t                     m_capacityLimit{0};

}; // class VectorStore

template <typename FUNC_T>
void VectorStore::for_each_live(FUNC_T&& func)
{
    for (SlotId const slot : m_slots.ids())
    {
        func(m_slots.handle_of(slot), m_position[slot], m_velocity[slot]);
    }
}

template <typename FUNC_T>
void VectorStore::for_each_live(FUNC_T&& func) const
{
    for (SlotId const slot : m_slots.ids())
    {
        func(m_slots.handle_of(slot), m_position[slot], m_velocity[slot]);
    }
}

} // namespace astro::kinematics
