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

#include "../core/generational_registry.h"
#include "../core/strong_id.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace astro::kinematics
{

using SlotId        = astro::StrongId<std::uint32_t, struct DummyForSlotId>;
using SlotHandle    = astro::GenHandle<SlotId>;

using EntityId      = astro::StrongId<std::uint32_t, struct DummyForEntityId>;
using EntityHandle  = astro::GenHandle<EntityId>;

enum class EKinematicsError : std::uint8_t
{
    InvalidIndex,       ///< Freed, never allocated, or out-of-range slot or entity
    OutOfCapacity,      ///< Allocation beyond a bounded store's capacity
    NonUnitQuaternion   ///< Orientation that is not a rotation within tolerance
};

constexpr char const* error_name(EKinematicsError const kind) noexcept
{
    switch (kind)
    {
    case EKinematicsError::InvalidIndex:        return "InvalidIndex";
    case EKinematicsError::OutOfCapacity:       return "OutOfCapacity";
    case EKinematicsError::NonUnitQuaternion:   return "NonUnitQuaternion";
    }
    return "Unknown";
}

/**
 * @brief Local, synchronous failure of a kinematics operation
 */
class KinematicsError : public std::runtime_error
{
public:
    KinematicsError(EKinematicsError const kind, std::string const& what)
     : std::runtime_error{std::string{error_name(kind)} + ": " + what}
     , m_kind{kind}
    { }

    EKinematicsError kind() const noexcept { return m_kind; }

private:
    EKinematicsError m_kind;
};

} // namespace astro::kinematics
