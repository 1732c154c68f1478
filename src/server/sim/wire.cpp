// SPDX-License-Identifier: Apache-2.0
#include "server/sim/wire.hpp"

namespace bulletsim::sim::wire {

namespace {
// An empty payload is rejected by the receiving loop as malformed.
template <typename Msg>
std::string serialize(const Msg &msg)
{
    std::string out;
    if (!msg.SerializeToString(&out))
        out.clear();
    return out;
}
} // namespace

void to_proto(const Vec3 &v, bulletsim::Vec3 *out)
{
    out->set_x(v.x);
    out->set_y(v.y);
    out->set_z(v.z);
}

Vec3 from_proto(const bulletsim::Vec3 &v)
{
    return Vec3{v.x(), v.y(), v.z()};
}

void fill_process(bulletsim::ProcessBullet *out, const BulletId &id, const BulletSpec &spec)
{
    out->set_id(id);
    out->set_participant(spec.participant);
    out->set_damage(spec.damage);
    out->set_range(spec.range);
    out->set_instant(spec.instant);
    to_proto(spec.origin, out->mutable_origin());
    to_proto(spec.direction, out->mutable_direction());
}

BulletSpec spec_from_proto(const bulletsim::ProcessBullet &msg)
{
    BulletSpec spec;
    spec.participant = msg.participant();
    spec.damage = msg.damage();
    spec.range = msg.range();
    spec.instant = msg.instant();
    spec.origin = from_proto(msg.origin());
    spec.direction = from_proto(msg.direction());
    return spec;
}

std::string encode_process(const BulletId &id, const BulletSpec &spec)
{
    bulletsim::WorkerMessage msg;
    fill_process(msg.mutable_process_bullet(), id, spec);
    return serialize(msg);
}

std::string encode_cancel(const BulletId &id)
{
    bulletsim::WorkerMessage msg;
    msg.mutable_cancel_bullet()->set_id(id);
    return serialize(msg);
}

std::string encode_destruct()
{
    bulletsim::WorkerMessage msg;
    msg.mutable_destruct();
    return serialize(msg);
}

std::string encode_complete(const BulletId &id, uint32_t worker)
{
    bulletsim::WorkerEvent ev;
    auto *bc = ev.mutable_bullet_complete();
    bc->set_id(id);
    bc->set_worker(worker);
    return serialize(ev);
}

} // namespace bulletsim::sim::wire
