// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "bulletsim.pb.h"
#include "server/net/event_router.hpp"
#include "server/sim/simulator.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace bulletsim::net {

// Applies one API request. Returns the direct reply, if the request has one; events for fired bullets
// arrive later through `outbox`.
std::optional<bulletsim::ServerMessage> handle_request(
    const bulletsim::ClientMessage &request,
    bulletsim::sim::BulletSimulator &sim,
    EventRouter &router,
    const std::shared_ptr<Outbox> &outbox);

// Starts the TCP accept loop on the given port; exits once the simulator shuts down.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    std::shared_ptr<bulletsim::sim::BulletSimulator> sim,
    std::shared_ptr<EventRouter> router);

} // namespace bulletsim::net
