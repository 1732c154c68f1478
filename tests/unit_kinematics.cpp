// SPDX-License-Identifier: Apache-2.0
#include "server/sim/kinematics.hpp"
#include "test_world.hpp"

#include <cassert>
#include <iostream>

using bulletsim::sim::advance;
using bulletsim::sim::Vec3;
using bulletsim::test::approx;

int main()
{
    // Direction is normalized; distance is speed * dt.
    auto s = advance(Vec3{0.f}, Vec3{3.f, 4.f, 0.f}, 100.f, 0.5f);
    assert(approx(s.distance, 50.f));
    assert(approx(s.position.x, 30.f) && approx(s.position.y, 40.f) && approx(s.position.z, 0.f));
    // Same inputs, same output.
    auto a = advance(Vec3{1.f, 2.f, 3.f}, Vec3{0.f, 0.f, -2.f}, 1000.f, 0.033f);
    auto b = advance(Vec3{1.f, 2.f, 3.f}, Vec3{0.f, 0.f, -2.f}, 1000.f, 0.033f);
    assert(a.position == b.position && a.distance == b.distance);
    assert(approx(a.position.z, 3.f - 33.f));
    // Zero dt does not move.
    auto z = advance(Vec3{5.f, 5.f, 5.f}, Vec3{1.f, 0.f, 0.f}, 1000.f, 0.f);
    assert(z.position == Vec3(5.f, 5.f, 5.f) && z.distance == 0.f);
    std::cout << "unit_kinematics OK" << std::endl;
    return 0;
}
