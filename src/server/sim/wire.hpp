// SPDX-License-Identifier: Apache-2.0
// wire.hpp - Dispatcher <-> worker channel encoding (bulletsim.proto)
#pragma once
#include "bulletsim.pb.h"
#include "server/sim/types.hpp"

#include <cstdint>
#include <string>

namespace bulletsim::sim::wire {

void to_proto(const Vec3 &v, bulletsim::Vec3 *out);
Vec3 from_proto(const bulletsim::Vec3 &v);

void fill_process(bulletsim::ProcessBullet *out, const BulletId &id, const BulletSpec &spec);
BulletSpec spec_from_proto(const bulletsim::ProcessBullet &msg);

// Serialized WorkerMessage / WorkerEvent payloads carried by the mailboxes.
std::string encode_process(const BulletId &id, const BulletSpec &spec);
std::string encode_cancel(const BulletId &id);
std::string encode_destruct();
std::string encode_complete(const BulletId &id, uint32_t worker);

} // namespace bulletsim::sim::wire
