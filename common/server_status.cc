// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/server_status.h"

namespace warden {

void ServerStatusSnapshot::ToProto(proto::ServerStatus *dest) const {
  dest->set_id(id);
  dest->set_name(name);
  dest->set_state(ServerStateToProto(state));
  dest->set_pid(pid);
  dest->set_uptime_secs(uptime_secs);
  dest->set_player_count(player_count);
  for (auto &player : players) {
    dest->add_players(player);
  }
  dest->set_cpu_percent(cpu_percent);
  dest->set_resident_bytes(resident_bytes);
  dest->set_tps(tps);
}

} // namespace warden
