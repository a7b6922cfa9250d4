// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/server_definition.h"

#include <string>
#include <vector>

namespace warden {

// Durable collection of server definitions kept in a text format
// ServerStore protobuf file.  The file is rewritten on every change by
// writing a temporary file and renaming it over the old one.  An empty
// filename keeps everything in memory.
class DefinitionStore {
public:
  explicit DefinitionStore(std::string filename)
      : filename_(std::move(filename)) {}

  const std::string &Filename() const { return filename_; }

  // A missing file is an empty store.
  absl::Status Load();

  // Ordered by creation time.
  std::vector<ServerDefinition> List() const;

  absl::StatusOr<ServerDefinition> Find(const std::string &id) const;

  bool Contains(const std::string &id) const {
    return definitions_.find(id) != definitions_.end();
  }

  // Insert or replace.
  absl::Status Put(ServerDefinition def);

  absl::Status Remove(const std::string &id);

  absl::Status UpdateStatus(const std::string &id, ServerState state, int pid);

  size_t Size() const { return definitions_.size(); }

private:
  absl::Status Save() const;

  std::string filename_;
  absl::flat_hash_map<std::string, ServerDefinition> definitions_;
};

// Nanoseconds since the epoch.
uint64_t WallClockNanos();

} // namespace warden
