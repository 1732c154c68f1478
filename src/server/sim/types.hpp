// SPDX-License-Identifier: Apache-2.0
// types.hpp - Bullet descriptors, simulation tunables and dispatcher snapshots
#pragma once
#include <glm/glm.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace bulletsim::sim {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Vec3 = glm::vec3;
using BulletId = std::string;
using ParticipantId = uint64_t;
using EntityHandle = uint64_t; // 0 = no entity

// Immutable fire request, created by the caller.
struct BulletSpec
{
    ParticipantId participant{0};
    float damage{0.f};
    float range{0.f};
    Vec3 origin{0.f};
    Vec3 direction{0.f}; // need not be normalized; must be non-zero
    bool instant{false};
};

inline bool is_valid(const BulletSpec &spec)
{
    if (!std::isfinite(spec.range) || spec.range <= 0.f)
        return false;
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(spec.origin[i]) || !std::isfinite(spec.direction[i]))
            return false;
    }
    return glm::length(spec.direction) > 0.f;
}

struct SimConfig
{
    uint32_t worker_count{14};
    uint32_t worker_capacity{35};
    std::chrono::milliseconds tick_interval{33};
    float projectile_speed{1000.f}; // units per second
    std::chrono::milliseconds max_lifetime{12000};
    std::chrono::milliseconds default_timeout{15000};
    float proximity_radius{8.5f};
    float max_range{5000.f}; // longest range a fire request may ask for
    bool proximity_fallback{true};
    std::chrono::milliseconds destruct_grace{1250};

    // Reclamation runs at half the default timeout.
    std::chrono::milliseconds reclaim_interval() const
    {
        return std::max(default_timeout / 2, std::chrono::milliseconds(1));
    }
};

struct WorkerLoadSnapshot
{
    uint32_t worker{0};
    uint32_t load{0};
    std::vector<BulletId> bullets;
};

struct DispatcherStats
{
    size_t queued{0};
    size_t in_flight{0};
    uint32_t total_workers{0};
    std::vector<WorkerLoadSnapshot> workers;
};

} // namespace bulletsim::sim
