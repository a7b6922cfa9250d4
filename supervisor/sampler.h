// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include <cstdint>
#include <string>

namespace warden {

struct ResourceUsage {
  double cpu_percent;
  uint64_t resident_bytes;
};

// Reads process cpu time and resident memory from /proc.  The cpu
// percentage is computed from the difference between two samples so the
// first sample for a pid always reports 0.
class Sampler {
public:
  explicit Sampler(std::string proc_root = "/proc");

  absl::StatusOr<ResourceUsage> Sample(int pid, uint64_t now_ns);

  // Drop the history for a pid that has gone.
  void Forget(int pid) { previous_.erase(pid); }

  // Drop the history for every pid not in live.
  void Retain(const absl::flat_hash_set<int> &live);

  size_t NumTracked() const { return previous_.size(); }

  // utime + stime in clock ticks.
  absl::StatusOr<uint64_t> ReadCpuTicks(int pid) const;
  absl::StatusOr<uint64_t> ReadResidentBytes(int pid) const;

  void SetTicksPerSecond(long ticks) { ticks_per_sec_ = ticks; }
  void SetPageSize(long size) { page_size_ = size; }

private:
  struct Previous {
    uint64_t ticks;
    uint64_t when;
  };

  std::string proc_root_;
  long ticks_per_sec_;
  long page_size_;
  absl::flat_hash_map<int, Previous> previous_;
};

} // namespace warden
