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
#include <astro/kinematics/kinematicstypes.h>
#include <astro/kinematics/orientation.h>

#include <Magnum/Math/Angle.h>
#include <Magnum/Math/Constants.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

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

static Quaterniond random_unit_quat(std::mt19937 &rGen)
{
    std::normal_distribution<double> dist(0.0, 1.0);
    return Quaterniond{{dist(rGen), dist(rGen), dist(rGen)}, dist(rGen)}.normalized();
}

// q * conjugate(q) is the identity for any rotation
TEST(Orientation, ProductWithConjugateIsIdentity)
{
    std::mt19937 gen(69);

    for (int i = 0; i < 200; ++i)
    {
        Quaterniond const q = random_unit_quat(gen);
        expect_near_quat((q * q.conjugated()).normalized(), Quaterniond{IdentityInit}, 1e-9);
    }
}

TEST(Orientation, UnitTolerance)
{
    Quaterniond const unit = rotor(30.0_deg, {1.0, 2.0, 3.0});

    EXPECT_TRUE(is_unit(unit));
    EXPECT_TRUE(is_unit(unit * (1.0 + 5e-7)));
    EXPECT_FALSE(is_unit(unit * (1.0 + 5e-6)));
    EXPECT_FALSE(is_unit(Quaterniond{{0.0, 0.0, 0.0}, 0.0}));
    EXPECT_FALSE(is_unit(Quaterniond{{std::nan(""), 0.0, 0.0}, 1.0}));

    // Slightly off is accepted and normalized
    Quaterniond const fixed = normalize_checked(unit * (1.0 + 5e-7));
    EXPECT_NEAR(fixed.length(), 1.0, 1e-15);

    try
    {
        (void) normalize_checked(unit * 2.0);
        FAIL() << "Expected NonUnitQuaternion";
    }
    catch (KinematicsError const& e)
    {
        EXPECT_EQ(e.kind(), EKinematicsError::NonUnitQuaternion);
    }
}

// A zero quaternion never normalizes, even under a tolerance that lets its
// length through
TEST(Orientation, ZeroQuaternionRejected)
{
    Quaterniond const zero{{0.0, 0.0, 0.0}, 0.0};

    EXPECT_TRUE(is_unit(zero, 1.5));

    try
    {
        (void) normalize_checked(zero, 1.5);
        FAIL() << "Expected NonUnitQuaternion";
    }
    catch (KinematicsError const& e)
    {
        EXPECT_EQ(e.kind(), EKinematicsError::NonUnitQuaternion);
    }
}

TEST(Orientation, RotorRejectsZeroAxis)
{
    EXPECT_THROW((void) rotor(90.0_deg, {0.0, 0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW((void) rotor(90.0_deg, {std::nan(""), 1.0, 0.0}), std::invalid_argument);
    EXPECT_THROW((void) rotor(90.0_deg, {std::numeric_limits<double>::infinity(), 0.0, 0.0}), std::invalid_argument);

    // Axis doesn't need to be normalized
    expect_near_quat(rotor(90.0_deg, {0.0, 0.0, 5.0}), rotor(90.0_deg, {0.0, 0.0, 1.0}), 1e-12);
}

// Spin quaternions scale by time about the same axis
TEST(Orientation, AngularVelocityScaling)
{
    Vector3d const axis{0.0, 0.0, 1.0};
    Quaterniond const spin = rotor(40.0_deg, axis);

    expect_near_quat(quat_from_angular_velocity(spin, 0.0),  Quaterniond{IdentityInit},  1e-12);
    expect_near_quat(quat_from_angular_velocity(spin, 1.0),  spin,                       1e-12);
    expect_near_quat(quat_from_angular_velocity(spin, 0.5),  rotor(20.0_deg, axis),      1e-12);
    expect_near_quat(quat_from_angular_velocity(spin, 2.0),  rotor(80.0_deg, axis),      1e-12);
    expect_near_quat(quat_from_angular_velocity(spin, -1.0), spin.conjugated(),          1e-12);

    // Identity spin has no axis, stays identity for any time
    expect_near_quat(quat_from_angular_velocity(Quaterniond{IdentityInit}, 1000.0),
                     Quaterniond{IdentityInit}, 1e-12);

    // Spin over 180 degrees per second is kept as is, not shortened
    Quaterniond const fast = rotor(270.0_deg, axis);
    expect_near_quat(quat_from_angular_velocity(fast, 1.0 / 3.0), rotor(90.0_deg, axis), 1e-12);
}

TEST(Orientation, AngularVelocityVector)
{
    Vector3d const omega = angular_velocity_vector(rotor(90.0_deg, {0.0, 1.0, 0.0}));
    expect_near_vec(omega, {0.0, Magnum::Math::Constants<double>::piHalf(), 0.0}, 1e-12);

    expect_near_vec(angular_velocity_vector(Quaterniond{IdentityInit}), {0.0, 0.0, 0.0}, 0.0);
}

TEST(Orientation, RotateAndInverse)
{
    // Quarter turn counter-clockwise about up takes north to west
    Quaterniond const q = rotor(90.0_deg, {0.0, 0.0, 1.0});

    expect_near_vec(rotate({0.0, 1.0, 0.0}, q),         {-1.0, 0.0, 0.0}, 1e-12);
    expect_near_vec(inverse_rotate({-1.0, 0.0, 0.0}, q), {0.0, 1.0, 0.0}, 1e-12);

    std::mt19937 gen(42);
    for (int i = 0; i < 50; ++i)
    {
        Quaterniond const r = random_unit_quat(gen);
        Vector3d const v{1.5, -2.0, 7.25};
        expect_near_vec(inverse_rotate(rotate(v, r), r), v, 1e-9);
    }
}

TEST(Orientation, DifferenceAndComposition)
{
    Quaterniond const a = rotor(30.0_deg, {1.0, 0.0, 0.0});
    Quaterniond const b = rotor(75.0_deg, {0.0, 1.0, 1.0});

    // a * (a^-1 * b) == b
    expect_near_quat(a * quat_difference(a, b), b, 1e-12);
    expect_near_quat(quat_difference(b, b), Quaterniond{IdentityInit}, 1e-12);
}

TEST(Orientation, Facing)
{
    expect_near_vec(facing(Quaterniond{IdentityInit}), {0.0, 1.0, 0.0}, 1e-12);

    // Turn 90 degrees clockwise (seen from above) to face east
    expect_near_vec(facing(rotor(-90.0_deg, {0.0, 0.0, 1.0})), {1.0, 0.0, 0.0}, 1e-12);

    // Pitch up to face the zenith
    expect_near_vec(facing(rotor(90.0_deg, {1.0, 0.0, 0.0})), {0.0, 0.0, 1.0}, 1e-12);
}
