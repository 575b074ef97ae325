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

#include "keyed_vector.h"

#include <longeron/id_management/registry_stl.hpp>

#include <cstddef>
#include <cstdint>

namespace astro
{

using generation_t = std::uint32_t;

/**
 * @brief ID paired with the generation it was created in
 *
 * IDs are recycled by the registry once removed. The generation tells a
 * handle to a removed ID apart from a handle to the ID's new occupant.
 */
template <typename ID_T>
struct GenHandle
{
    ID_T            id;
    generation_t    generation{0};

    constexpr bool operator==(GenHandle const&) const noexcept = default;

    constexpr bool has_value() const noexcept { return id.has_value(); }
};

/**
 * @brief lgrn::IdRegistryStl with a generation counter per ID
 *
 * The generation of an ID is bumped every time it is removed, invalidating
 * every handle created before the removal.
 */
template <typename ID_T>
class GenerationalRegistry
{
public:

    using Handle_t = GenHandle<ID_T>;

    [[nodiscard]] Handle_t create()
    {
        ID_T const id = m_ids.create();
        if (m_generationOf.size() < m_ids.capacity())
        {
            m_generationOf.resize(m_ids.capacity(), 0);
        }
        return {id, m_generationOf[id]};
    }

    /**
     * @brief Remove the ID referred to by a handle
     *
     * @return false if the handle was already stale, nothing is removed then
     */
    bool remove(Handle_t const handle)
    {
        if ( ! is_live(handle) )
        {
            return false;
        }
        m_ids.remove(handle.id);
        ++ m_generationOf[handle.id];
        return true;
    }

    [[nodiscard]] bool is_live(Handle_t const handle) const noexcept
    {
        return    handle.id.has_value()
               && m_generationOf.contains_index(handle.id)
               && m_ids.exists(handle.id)
               && m_generationOf[handle.id] == handle.generation;
    }

    /**
     * @return Handle for an ID that currently exists
     */
    [[nodiscard]] Handle_t handle_of(ID_T const id) const noexcept
    {
        return {id, m_generationOf[id]};
    }

    std::size_t size() const noexcept       { return m_ids.size(); }
    std::size_t capacity() const noexcept   { return m_ids.capacity(); }

    /// Iterable range of existing IDs, in ascending order
    lgrn::IdRegistryStl<ID_T> const& ids() const noexcept { return m_ids; }

private:

    lgrn::IdRegistryStl<ID_T>       m_ids;
    KeyedVec<ID_T, generation_t>    m_generationOf;

}; // class GenerationalRegistry

} // namespace astro
