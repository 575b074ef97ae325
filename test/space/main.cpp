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
#include <astro/kinematics/space.h>

#include <Magnum/Math/Angle.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace astro;
using namespace astro::kinematics;

using namespace Magnum::Math::Literals;

static void expect_near_quat(Quaterniond const& a, Quaterniond const& b, double maxError)
{
    EXPECT_NEAR(a.scalar(),     b.scalar(),     maxError);
    EXPECT_NEAR(a.vector().x(), b.vector().x(), maxError);
    EXPECT_NEAR(a.vector().y(), b.vector().y(), maxError);
    EXPECT_NEAR(a.vector().z(), b.vector().z(), maxError);
}

static void expect_near_vec(Vector3d const& a, Vector3d const& b, double maxError)
{
    EXPECT_NEAR(a.x(), b.x(), maxError);
    EXPECT_NEAR(a.y(), b.y(), maxError);
    EXPECT_NEAR(a.z(), b.z(), maxError);
}

static EKinematicsError error_of(auto&& func)
{
    try
    {
        func();
    }
    catch (KinematicsError const& e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "Expected a KinematicsError";
    return EKinematicsError::InvalidIndex;
}

TEST(Space, SpawnAndDespawn)
{
    Space space;

    EntityHandle const a = space.spawn_entity({1.0, 0.0, 0.0});
    EntityHandle const b = space.spawn_entity({0.0, 2.0, 0.0}, {0.0, 0.0, 1.0});

    EXPECT_EQ(space.entity_count(), 2);
    EXPECT_TRUE(space.exists(a));
    EXPECT_TRUE(space.exists(b));

    EntityState const state = space.state_of(b);
    EXPECT_EQ(state.position, Vector3d(0.0, 2.0, 0.0));
    EXPECT_EQ(state.velocity, Vector3d(0.0, 0.0, 1.0));
    expect_near_quat(state.heading,  Quaterniond{IdentityInit}, 0.0);
    expect_near_quat(state.rotation, Quaterniond{IdentityInit}, 0.0);

    space.despawn_entity(a);

    EXPECT_FALSE(space.exists(a));
    EXPECT_EQ(space.entity_count(), 1);
    EXPECT_EQ(space.position(b), Vector3d(0.0, 2.0, 0.0));

    std::vector<EntityHandle> const live = space.entities();
    ASSERT_EQ(live.size(), 1);
    EXPECT_EQ(live[0], b);
}

// Handles to despawned entities stay invalid even after their IDs are reused
TEST(Space, StaleHandles)
{
    Space space;

    EntityHandle const old = space.spawn_entity({5.0, 5.0, 5.0});
    space.despawn_entity(old);

    EntityHandle const fresh = space.spawn_entity({1.0, 1.0, 1.0});
    EXPECT_NE(fresh, old);

    EXPECT_EQ(error_of([&] { (void) space.position(old); }),           EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { (void) space.heading(old); }),            EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { (void) space.state_of(old); }),           EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { space.set_velocity(old, {1.0, 0.0, 0.0}); }), EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { space.despawn_entity(old); }),            EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { (void) space.relative_to(fresh, old); }), EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { (void) space.bearing(old, fresh); }),     EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { (void) space.position(EntityHandle{}); }), EKinematicsError::InvalidIndex);

    EXPECT_EQ(space.position(fresh), Vector3d(1.0, 1.0, 1.0));
    EXPECT_EQ(space.velocity(fresh), Vector3d(0.0, 0.0, 0.0));
}

TEST(Space, Capacity)
{
    Space space{SpaceConfig{.slotCapacity = 2}};

    EntityHandle const a = space.spawn_entity();
    (void) space.spawn_entity();

    EXPECT_EQ(error_of([&] { (void) space.spawn_entity(); }), EKinematicsError::OutOfCapacity);
    EXPECT_EQ(space.entity_count(), 2);

    space.despawn_entity(a);
    EXPECT_NO_THROW((void) space.spawn_entity());
}

TEST(Space, RejectsBadOrientation)
{
    Space space;

    Quaterniond const bad{{0.0, 0.0, 0.0}, 3.0};

    EXPECT_EQ(error_of([&] { (void) space.spawn_entity({}, {}, bad); }), EKinematicsError::NonUnitQuaternion);
    EXPECT_EQ(space.entity_count(), 0);

    EntityHandle const e = space.spawn_entity();
    EXPECT_EQ(error_of([&] { space.set_rotation(e, bad); }), EKinematicsError::NonUnitQuaternion);
    expect_near_quat(space.rotation(e), Quaterniond{IdentityInit}, 0.0);

    // Tolerance comes from the config
    Space loose{SpaceConfig{.quatTolerance = 0.5}};
    EntityHandle const f = loose.spawn_entity();
    EXPECT_NO_THROW(loose.set_heading(f, Quaterniond{IdentityInit} * 1.2));
    EXPECT_NEAR(loose.heading(f).length(), 1.0, 1e-15);
}

// Tolerances of 1 or more would let a zero quaternion pass as unit length
TEST(Space, RejectsBadTolerance)
{
    EXPECT_THROW(Space{SpaceConfig{.quatTolerance = 1.0}}, std::invalid_argument);
    EXPECT_THROW(Space{SpaceConfig{.quatTolerance = 1.5}}, std::invalid_argument);
    EXPECT_THROW(Space{SpaceConfig{.quatTolerance = 0.0}}, std::invalid_argument);
    EXPECT_THROW(Space{SpaceConfig{.quatTolerance = std::nan("")}}, std::invalid_argument);

    Space loose{SpaceConfig{.quatTolerance = 0.99}};
    Quaterniond const zero{{0.0, 0.0, 0.0}, 0.0};

    EXPECT_EQ(error_of([&] { (void) loose.spawn_entity({}, {}, zero); }), EKinematicsError::NonUnitQuaternion);
    EXPECT_EQ(loose.entity_count(), 0);

    EntityHandle const e = loose.spawn_entity();
    EXPECT_EQ(error_of([&] { loose.set_heading(e, zero); }), EKinematicsError::NonUnitQuaternion);
    EXPECT_TRUE(is_finite(loose.heading(e)));
}

TEST(Space, TickMovesEverything)
{
    Space space;

    EntityHandle const a = space.spawn_entity({0.0, 0.0, 0.0}, {1.0, 0.0, 0.0});
    EntityHandle const b = space.spawn_entity(
            {0.0, 0.0, 0.0}, {0.0, -2.0, 0.0},
            Quaterniond{IdentityInit}, rotor(30.0_deg, {0.0, 0.0, 1.0}));

    TickReport const report = space.tick(2.0);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.integrated, 2);

    expect_near_vec(space.position(a), {2.0, 0.0, 0.0}, 1e-12);
    expect_near_vec(space.position(b), {0.0, -4.0, 0.0}, 1e-12);
    expect_near_quat(space.heading(b), rotor(60.0_deg, {0.0, 0.0, 1.0}), 1e-12);

    // Zero time changes nothing
    EXPECT_TRUE(space.tick(0.0).ok());
    expect_near_vec(space.position(a), {2.0, 0.0, 0.0}, 0.0);
}

TEST(Space, TickIsAdditive)
{
    Space one;
    Space two;

    auto const spawn = [] (Space& rSpace)
    {
        return rSpace.spawn_entity(
                {100.0, -50.0, 25.0}, {-1.5, 3.0, 0.75},
                rotor(12.0_deg, {1.0, 1.0, 1.0}), rotor(7.0_deg, {0.0, 1.0, -1.0}));
    };

    EntityHandle const e1 = spawn(one);
    EntityHandle const e2 = spawn(two);

    for (int i = 0; i < 10; ++i)
    {
        (void) one.tick(0.1);
    }
    (void) two.tick(1.0);

    expect_near_vec(one.position(e1), two.position(e2), 1e-9);
    expect_near_quat(one.heading(e1), two.heading(e2), 1e-9);
}

// A failure in one entity is reported, the others still integrate
TEST(Space, TickReportsPerEntityFailure)
{
    Space space;

    EntityHandle const calm = space.spawn_entity({}, {1.0e-300, 0.0, 0.0});
    EntityHandle const wild = space.spawn_entity(
            {5.0, 6.0, 7.0}, {1.0, 0.0, 0.0},
            Quaterniond{IdentityInit}, rotor(170.0_deg, {0.0, 0.0, 1.0}));

    Quaterniond const wildHeading = space.heading(wild);

    // Finite, but spin angle times dt overflows
    TickReport const report = space.tick(std::numeric_limits<double>::max());

    EXPECT_EQ(report.integrated, 1);
    ASSERT_EQ(report.failures.size(), 1);
    EXPECT_EQ(report.failures[0].entity, wild);
    EXPECT_EQ(report.failures[0].error, EKinematicsError::NonUnitQuaternion);

    // The failed entity is left whole, not moved without turning
    expect_near_quat(space.heading(wild), wildHeading, 0.0);
    EXPECT_EQ(space.position(wild), Vector3d(5.0, 6.0, 7.0));
    EXPECT_EQ(space.velocity(wild), Vector3d(1.0, 0.0, 0.0));

    // The other one still moved
    expect_near_quat(space.heading(calm), Quaterniond{IdentityInit}, 0.0);
    EXPECT_DOUBLE_EQ(space.position(calm).x(), 1.0e-300 * std::numeric_limits<double>::max());

    // Next tick is normal again for both
    space.set_rotation(wild, Quaterniond{IdentityInit});
    EXPECT_TRUE(space.tick(1.0).ok());
    EXPECT_EQ(space.position(wild), Vector3d(6.0, 6.0, 7.0));
}

TEST(Space, TickRejectsNonFinite)
{
    Space space;
    EntityHandle const e = space.spawn_entity({1.0, 2.0, 3.0}, {1.0, 1.0, 1.0});

    EXPECT_THROW((void) space.tick(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW((void) space.tick(std::nan("")), std::invalid_argument);

    EXPECT_EQ(space.position(e), Vector3d(1.0, 2.0, 3.0));
}

TEST(Space, SettersAndImpulse)
{
    Space space;
    EntityHandle const e = space.spawn_entity();

    space.set_position(e, {1.0, 1.0, 1.0});
    space.set_velocity(e, {0.0, 1.0, 0.0});
    space.add_velocity(e, {0.0, 1.0, 2.0});
    space.set_heading(e, rotor(90.0_deg, {1.0, 0.0, 0.0}));
    space.set_rotation(e, rotor(5.0_deg, {0.0, 1.0, 0.0}));

    EntityState const state = space.state_of(e);
    EXPECT_EQ(state.position, Vector3d(1.0, 1.0, 1.0));
    EXPECT_EQ(state.velocity, Vector3d(0.0, 2.0, 2.0));
    expect_near_quat(state.heading,  rotor(90.0_deg, {1.0, 0.0, 0.0}), 1e-12);
    expect_near_quat(state.rotation, rotor(5.0_deg,  {0.0, 1.0, 0.0}), 1e-12);
}

TEST(Space, SphericalAndCylindricalState)
{
    Space space;
    EntityHandle const e = space.spawn_entity();

    space.set_position_spherical(e, {200.0, Degd{0.0}, Degd{180.0}});
    expect_near_vec(space.position(e), {0.0, -200.0, 0.0}, 1e-9);

    space.set_velocity_cylindrical(e, {10.0, Degd{90.0}, -1.0});
    expect_near_vec(space.velocity(e), {10.0, 0.0, -1.0}, 1e-12);

    Cylindrical const posCyl = space.position_cylindrical(e);
    EXPECT_NEAR(posCyl.radius, 200.0, 1e-9);
    EXPECT_NEAR(std::abs(double(posCyl.phi)), 180.0, 1e-9);
    EXPECT_NEAR(posCyl.height, 0.0, 1e-12);

    Spherical const velSph = space.velocity_spherical(e);
    EXPECT_NEAR(velSph.rho, std::sqrt(101.0), 1e-12);
    EXPECT_NEAR(double(velSph.phi), 90.0, 1e-9);
    EXPECT_LT(double(velSph.theta), 0.0);

    space.set_position_cylindrical(e, {0.0, Degd{0.0}, 30.0});
    space.set_velocity_spherical(e, {4.0, Degd{0.0}, Degd{0.0}});

    Spherical const posSph = space.position_spherical(e);
    EXPECT_NEAR(posSph.rho, 30.0, 1e-12);
    EXPECT_NEAR(double(posSph.theta), 90.0, 1e-9);
    expect_near_vec(space.velocity(e), {0.0, 4.0, 0.0}, 1e-12);

    Cylindrical const velCyl = space.velocity_cylindrical(e);
    EXPECT_NEAR(velCyl.radius, 4.0, 1e-12);

    space.despawn_entity(e);
    EXPECT_EQ(error_of([&] { space.set_position_spherical(e, {}); }), EKinematicsError::InvalidIndex);
    EXPECT_EQ(error_of([&] { (void) space.velocity_cylindrical(e); }), EKinematicsError::InvalidIndex);
}

TEST(Space, RelativeAndBearing)
{
    Space space;

    EntityHandle const viewer = space.spawn_entity({0.0, 0.0, 0.0}, {}, rotor(-90.0_deg, {0.0, 0.0, 1.0}));
    EntityHandle const target = space.spawn_entity({100.0, 0.0, 100.0});

    RelativeSnapshot const rel = space.relative_to(target, viewer);
    expect_near_vec(rel.position(), {0.0, 100.0, 100.0}, 1e-9);

    Spherical const b = space.bearing(target, viewer);
    EXPECT_NEAR(b.rho, 100.0 * std::sqrt(2.0), 1e-9);
    EXPECT_NEAR(double(b.theta), 45.0, 1e-9);
    EXPECT_NEAR(double(b.phi),   0.0, 1e-9);

    // Reading didn't move anything
    EXPECT_EQ(space.position(target), Vector3d(100.0, 0.0, 100.0));
}

// Separate spaces are separate coordinate domains
TEST(Space, IndependentSpaces)
{
    Space home;
    Space away;

    EntityHandle const h = home.spawn_entity({1.0, 0.0, 0.0}, {1.0, 0.0, 0.0});
    EntityHandle const a = away.spawn_entity({-1.0, 0.0, 0.0});

    (void) home.tick(1.0);

    EXPECT_EQ(home.position(h), Vector3d(2.0, 0.0, 0.0));
    EXPECT_EQ(away.position(a), Vector3d(-1.0, 0.0, 0.0));

    away.despawn_entity(a);
    EXPECT_TRUE(home.exists(h));
    EXPECT_EQ(away.entity_count(), 0);
}

// Readers on other threads always see whole ticks
TEST(Space, ConcurrentReadsDuringTicks)
{
    constexpr int const sc_ticks = 200;

    Space space;
    EntityHandle const e = space.spawn_entity({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0});

    std::thread writer{[&space] ()
    {
        for (int i = 0; i < sc_ticks; ++i)
        {
            (void) space.tick(1.0);
        }
    }};

    for (int i = 0; i < sc_ticks; ++i)
    {
        Vector3d const pos = space.position(e);

        // All components move together
        EXPECT_EQ(pos.x(), pos.y());
        EXPECT_EQ(pos.y(), pos.z());
    }

    writer.join();
    EXPECT_EQ(space.position(e), Vector3d(double(sc_ticks), double(sc_ticks), double(sc_ticks)));
}
