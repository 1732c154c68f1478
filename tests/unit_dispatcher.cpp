// SPDX-License-Identifier: Apache-2.0
// Dispatcher: validation, least-loaded assignment, overflow, cancel, completion and reclamation.
#include "bulletsim.pb.h"
#include "common/metrics.hpp"
#include "server/sim/dispatcher.hpp"
#include "server/sim/wire.hpp"
#include "test_world.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

using namespace bulletsim::sim;
using bulletsim::test::RecordingEvents;
using namespace std::chrono_literals;

struct Rig
{
    std::vector<std::shared_ptr<Channel>> inboxes;
    std::shared_ptr<Channel> completions = std::make_shared<Channel>();
    std::shared_ptr<RecordingEvents> events = std::make_shared<RecordingEvents>();
    std::unique_ptr<Dispatcher> dispatcher;

    explicit Rig(uint32_t workers, uint32_t capacity = 35, std::chrono::milliseconds timeout = 15000ms)
    {
        SimConfig cfg;
        cfg.worker_count = workers;
        cfg.worker_capacity = capacity;
        cfg.default_timeout = timeout;
        for (uint32_t i = 0; i < workers; ++i)
            inboxes.push_back(std::make_shared<Channel>());
        dispatcher = std::make_unique<Dispatcher>(cfg, inboxes, completions, events);
    }

    // Decoded payload kinds waiting in one worker inbox.
    std::vector<bulletsim::WorkerMessage> take(size_t worker)
    {
        std::vector<bulletsim::WorkerMessage> out;
        for (auto &bytes : inboxes[worker]->drain()) {
            bulletsim::WorkerMessage m;
            assert(m.ParseFromString(bytes));
            out.push_back(m);
        }
        return out;
    }
};

static BulletSpec spec()
{
    return BulletSpec{1, 10.f, 100.f, Vec3{0.f}, Vec3{0.f, 1.f, 0.f}, false};
}

static void rejects_bad_input()
{
    std::vector<std::shared_ptr<Channel>> none;
    bool threw = false;
    try {
        Dispatcher d(SimConfig{}, none, std::make_shared<Channel>(), std::make_shared<RecordingEvents>());
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    Rig rig(1);
    auto bad = spec();
    bad.direction = Vec3{0.f};
    threw = false;
    try {
        rig.dispatcher->queue_bullet(bad);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    bad = spec();
    bad.range = -1.f;
    threw = false;
    try {
        rig.dispatcher->queue_bullet(bad);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    bad = spec();
    bad.range = SimConfig{}.max_range * 2.f;
    threw = false;
    try {
        rig.dispatcher->queue_bullet(bad);
    } catch (const std::invalid_argument &ex) {
        threw = std::string(ex.what()).find("max_range") != std::string::npos;
    }
    assert(threw);
    bad.range = SimConfig{}.max_range;
    assert(rig.dispatcher->cancel_bullet(rig.dispatcher->queue_bullet(bad)));
    threw = false;
    try {
        rig.dispatcher->queue_bullet(spec(), 0ms);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    assert(rig.dispatcher->stats().queued == 0);
}

static void ids_are_unique()
{
    Rig rig(1);
    std::set<BulletId> ids;
    for (int i = 0; i < 100; ++i)
        ids.insert(rig.dispatcher->queue_bullet(spec()));
    assert(ids.size() == 100);
    Rig other(1);
    assert(!ids.count(other.dispatcher->queue_bullet(spec())));
}

static void least_loaded_assignment()
{
    Rig rig(3, 2);
    for (int i = 0; i < 4; ++i)
        rig.dispatcher->queue_bullet(spec());
    assert(rig.dispatcher->stats().queued == 4);
    auto now = Clock::now();
    assert(rig.dispatcher->assignment_pass(now) == 4);
    auto s = rig.dispatcher->stats();
    assert(s.queued == 0 && s.in_flight == 4 && s.total_workers == 3);
    assert(s.workers[0].load == 2 && s.workers[1].load == 1 && s.workers[2].load == 1);
    assert(s.workers[0].bullets.size() == 2);
    auto msgs = rig.take(0);
    assert(msgs.size() == 2 && msgs[0].has_process_bullet());
    // Nothing left to assign.
    assert(rig.dispatcher->assignment_pass(now) == 0);
}

static void overflow_goes_to_first_slot()
{
    auto &m = bulletsim::metrics::bullets();
    auto before = m.overflow_assignments_total.load();
    Rig rig(2, 1);
    for (int i = 0; i < 3; ++i)
        rig.dispatcher->queue_bullet(spec());
    assert(rig.dispatcher->assignment_pass(Clock::now()) == 3);
    auto s = rig.dispatcher->stats();
    assert(s.workers[0].load == 2 && s.workers[1].load == 1);
    assert(m.overflow_assignments_total.load() == before + 1);
}

static void cancel_pending_and_in_flight()
{
    Rig rig(1);
    auto pending = rig.dispatcher->queue_bullet(spec());
    assert(rig.dispatcher->cancel_bullet(pending));
    assert(rig.dispatcher->assignment_pass(Clock::now()) == 0);
    assert(rig.take(0).empty());

    auto flying = rig.dispatcher->queue_bullet(spec());
    rig.dispatcher->assignment_pass(Clock::now());
    assert(rig.take(0).size() == 1);
    assert(rig.dispatcher->cancel_bullet(flying));
    auto msgs = rig.take(0);
    assert(msgs.size() == 1 && msgs[0].has_cancel_bullet() && msgs[0].cancel_bullet().id() == flying);
    auto s = rig.dispatcher->stats();
    assert(s.in_flight == 0 && s.workers[0].load == 0);
    assert(!rig.dispatcher->cancel_bullet(flying));
    assert(!rig.dispatcher->cancel_bullet("nope"));
    // A late completion for a cancelled bullet is ignored.
    assert(!rig.dispatcher->on_bullet_complete(flying, 0));
    assert(rig.events->completed().empty());
}

static void completion_is_idempotent()
{
    Rig rig(2);
    auto id = rig.dispatcher->queue_bullet(spec());
    rig.dispatcher->assignment_pass(Clock::now());
    rig.completions->push(bulletsim::sim::wire::encode_complete(id, 0));
    rig.completions->push(bulletsim::sim::wire::encode_complete(id, 0));
    rig.completions->push(std::string{});
    assert(rig.dispatcher->drain_completions() == 1);
    assert(rig.events->completed_count(id) == 1);
    auto s = rig.dispatcher->stats();
    assert(s.in_flight == 0 && s.workers[0].load == 0 && s.workers[1].load == 0);
}

static void reclamation_after_timeout()
{
    Rig rig(1, 35, 100ms);
    auto t0 = Clock::now();
    auto a = rig.dispatcher->queue_bullet(spec());
    auto b = rig.dispatcher->queue_bullet(spec(), 500ms);
    rig.dispatcher->assignment_pass(t0);
    rig.take(0);
    assert(rig.dispatcher->reclamation_pass(t0 + 50ms) == 0);
    assert(rig.dispatcher->reclamation_pass(t0 + 100ms) == 1);
    auto reclaimed = rig.events->reclaimed();
    assert(reclaimed.size() == 1 && reclaimed[0] == a);
    auto msgs = rig.take(0);
    assert(msgs.size() == 1 && msgs[0].has_cancel_bullet() && msgs[0].cancel_bullet().id() == a);
    auto s = rig.dispatcher->stats();
    assert(s.in_flight == 1 && s.workers[0].bullets == std::vector<BulletId>{b});
    // Reclaimed ids never complete.
    assert(!rig.dispatcher->on_bullet_complete(a, 0));
    assert(rig.dispatcher->reclamation_pass(t0 + 500ms) == 1);
    assert(rig.events->completed().empty());
    assert(rig.dispatcher->stats().in_flight == 0);
}

static void shutdown_broadcasts_destruct()
{
    Rig rig(2);
    rig.dispatcher->queue_bullet(spec());
    rig.dispatcher->queue_bullet(spec());
    rig.dispatcher->assignment_pass(Clock::now());
    rig.dispatcher->queue_bullet(spec());
    rig.take(0);
    rig.take(1);
    rig.dispatcher->shutdown();
    rig.dispatcher->shutdown();
    for (size_t i = 0; i < 2; ++i) {
        auto msgs = rig.take(i);
        assert(msgs.size() == 1 && msgs[0].has_destruct());
    }
    assert(rig.dispatcher->is_shut_down());
    auto s = rig.dispatcher->stats();
    assert(s.queued == 0 && s.in_flight == 0);
    bool threw = false;
    try {
        rig.dispatcher->queue_bullet(spec());
    } catch (const std::logic_error &) {
        threw = true;
    }
    assert(threw);
}

int main()
{
    rejects_bad_input();
    ids_are_unique();
    least_loaded_assignment();
    overflow_goes_to_first_slot();
    cancel_pending_and_in_flight();
    completion_is_idempotent();
    reclamation_after_timeout();
    shutdown_broadcasts_destruct();
    std::cout << "unit_dispatcher OK" << std::endl;
    return 0;
}
