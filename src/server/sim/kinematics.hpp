// SPDX-License-Identifier: Apache-2.0
// kinematics.hpp - Straight-line projectile integration (no drag, no gravity)
#pragma once
#include "server/sim/types.hpp"

#include <glm/glm.hpp>

namespace bulletsim::sim {

struct KinematicStep
{
    Vec3 position{0.f};
    float distance{0.f};
};

// Pure: the same (position, direction, speed, dt) always yields the same step.
inline KinematicStep advance(const Vec3 &position, const Vec3 &direction, float speed, float dt)
{
    float move = speed * dt;
    return {position + glm::normalize(direction) * move, move};
}

} // namespace bulletsim::sim
