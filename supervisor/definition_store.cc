// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/definition_store.h"
#include "common/text_proto.h"
#include "absl/strings/str_format.h"
#include "proto/server.pb.h"
#include "toolbelt/fd.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
#include <time.h>
#include <unistd.h>

namespace warden {

uint64_t WallClockNanos() {
  struct timespec now_ts;
  clock_gettime(CLOCK_REALTIME, &now_ts);
  return now_ts.tv_sec * 1000000000ULL + now_ts.tv_nsec;
}

absl::Status DefinitionStore::Load() {
  if (filename_.empty()) {
    return absl::OkStatus();
  }
  toolbelt::FileDescriptor fd(open(filename_.c_str(), O_RDONLY));
  if (!fd.Valid()) {
    if (errno == ENOENT) {
      definitions_.clear();
      return absl::OkStatus();
    }
    return absl::InternalError(absl::StrFormat(
        "Failed to open server store %s: %s", filename_, strerror(errno)));
  }

  google::protobuf::io::FileInputStream in(fd.Fd());
  proto::ServerStore store;
  if (!google::protobuf::TextFormat::Parse(&in, &store)) {
    return absl::InternalError(
        absl::StrFormat("Failed to parse server store %s", filename_));
  }

  absl::flat_hash_map<std::string, ServerDefinition> definitions;
  for (auto &s : store.server()) {
    ServerDefinition def;
    def.FromProto(s);
    if (def.id.empty()) {
      return absl::InternalError(absl::StrFormat(
          "Server %s in %s has no id", def.name, filename_));
    }
    if (definitions.find(def.id) != definitions.end()) {
      return absl::InternalError(
          absl::StrFormat("Duplicate server %s in %s", def.id, filename_));
    }
    definitions.emplace(def.id, std::move(def));
  }
  definitions_ = std::move(definitions);
  return absl::OkStatus();
}

std::vector<ServerDefinition> DefinitionStore::List() const {
  std::vector<ServerDefinition> result;
  result.reserve(definitions_.size());
  for (auto & [ id, def ] : definitions_) {
    result.push_back(def);
  }
  std::sort(result.begin(), result.end(),
            [](const ServerDefinition &a, const ServerDefinition &b) {
              if (a.created_at != b.created_at) {
                return a.created_at < b.created_at;
              }
              return a.id < b.id;
            });
  return result;
}

absl::StatusOr<ServerDefinition>
DefinitionStore::Find(const std::string &id) const {
  auto it = definitions_.find(id);
  if (it == definitions_.end()) {
    return absl::NotFoundError(absl::StrFormat("No such server %s", id));
  }
  return it->second;
}

absl::Status DefinitionStore::Put(ServerDefinition def) {
  std::string id = def.id;
  auto it = definitions_.find(id);
  std::optional<ServerDefinition> old;
  if (it != definitions_.end()) {
    old = it->second;
  }
  def.updated_at = WallClockNanos();
  definitions_[id] = std::move(def);
  if (absl::Status status = Save(); !status.ok()) {
    // Keep memory consistent with the file.
    if (old.has_value()) {
      definitions_[id] = std::move(*old);
    } else {
      definitions_.erase(id);
    }
    return status;
  }
  return absl::OkStatus();
}

absl::Status DefinitionStore::Remove(const std::string &id) {
  auto it = definitions_.find(id);
  if (it == definitions_.end()) {
    return absl::NotFoundError(absl::StrFormat("No such server %s", id));
  }
  ServerDefinition old = std::move(it->second);
  definitions_.erase(it);
  if (absl::Status status = Save(); !status.ok()) {
    definitions_.emplace(id, std::move(old));
    return status;
  }
  return absl::OkStatus();
}

absl::Status DefinitionStore::UpdateStatus(const std::string &id,
                                           ServerState state, int pid) {
  auto it = definitions_.find(id);
  if (it == definitions_.end()) {
    return absl::NotFoundError(absl::StrFormat("No such server %s", id));
  }
  ServerDefinition old = it->second;
  it->second.status = state;
  it->second.pid = pid;
  it->second.updated_at = WallClockNanos();
  if (absl::Status status = Save(); !status.ok()) {
    definitions_[id] = std::move(old);
    return status;
  }
  return absl::OkStatus();
}

absl::Status DefinitionStore::Save() const {
  if (filename_.empty()) {
    return absl::OkStatus();
  }
  proto::ServerStore store;
  for (auto &def : List()) {
    def.ToProto(store.add_server());
  }
  return WriteTextProtoFile(filename_, store);
}

} // namespace warden
