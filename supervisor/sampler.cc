// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/sampler.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

#include <fstream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace warden {

namespace {
absl::StatusOr<std::string> ReadFile(const std::string &filename) {
  std::ifstream in(filename);
  if (!in) {
    return absl::NotFoundError(absl::StrFormat("Can't open %s", filename));
  }
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}
} // namespace

Sampler::Sampler(std::string proc_root)
    : proc_root_(std::move(proc_root)), ticks_per_sec_(sysconf(_SC_CLK_TCK)),
      page_size_(sysconf(_SC_PAGESIZE)) {}

absl::StatusOr<uint64_t> Sampler::ReadCpuTicks(int pid) const {
  std::string filename = absl::StrFormat("%s/%d/stat", proc_root_, pid);
  absl::StatusOr<std::string> contents = ReadFile(filename);
  if (!contents.ok()) {
    return contents.status();
  }
  // The command name is in parentheses and may contain spaces.  Fields
  // are counted from the closing parenthesis.
  size_t paren = contents->rfind(')');
  if (paren == std::string::npos) {
    return absl::InternalError(absl::StrFormat("Malformed %s", filename));
  }
  std::vector<std::string> fields =
      absl::StrSplit(contents->substr(paren + 1), ' ', absl::SkipEmpty());
  // fields[0] is the state (field 3), so utime (14) and stime (15) are
  // at 11 and 12.
  constexpr size_t kUtimeIndex = 11;
  constexpr size_t kStimeIndex = 12;
  if (fields.size() <= kStimeIndex) {
    return absl::InternalError(absl::StrFormat("Short %s", filename));
  }
  uint64_t utime, stime;
  if (!absl::SimpleAtoi(fields[kUtimeIndex], &utime) ||
      !absl::SimpleAtoi(fields[kStimeIndex], &stime)) {
    return absl::InternalError(
        absl::StrFormat("Invalid cpu times in %s", filename));
  }
  return utime + stime;
}

absl::StatusOr<uint64_t> Sampler::ReadResidentBytes(int pid) const {
  std::string filename = absl::StrFormat("%s/%d/statm", proc_root_, pid);
  absl::StatusOr<std::string> contents = ReadFile(filename);
  if (!contents.ok()) {
    return contents.status();
  }
  std::vector<std::string> fields =
      absl::StrSplit(*contents, absl::ByAnyChar(" \n"), absl::SkipEmpty());
  uint64_t pages;
  if (fields.size() < 2 || !absl::SimpleAtoi(fields[1], &pages)) {
    return absl::InternalError(absl::StrFormat("Malformed %s", filename));
  }
  return pages * page_size_;
}

absl::StatusOr<ResourceUsage> Sampler::Sample(int pid, uint64_t now_ns) {
  absl::StatusOr<uint64_t> ticks = ReadCpuTicks(pid);
  if (!ticks.ok()) {
    Forget(pid);
    return ticks.status();
  }
  absl::StatusOr<uint64_t> rss = ReadResidentBytes(pid);
  if (!rss.ok()) {
    Forget(pid);
    return rss.status();
  }

  ResourceUsage usage = {.cpu_percent = 0, .resident_bytes = *rss};
  auto it = previous_.find(pid);
  if (it != previous_.end() && now_ns > it->second.when &&
      *ticks >= it->second.ticks && ticks_per_sec_ > 0) {
    double cpu_secs =
        static_cast<double>(*ticks - it->second.ticks) / ticks_per_sec_;
    double wall_secs = (now_ns - it->second.when) / 1e9;
    usage.cpu_percent = 100.0 * cpu_secs / wall_secs;
  }
  previous_[pid] = {.ticks = *ticks, .when = now_ns};
  return usage;
}

void Sampler::Retain(const absl::flat_hash_set<int> &live) {
  absl::erase_if(previous_, [&live](const auto &entry) {
    return !live.contains(entry.first);
  });
}

} // namespace warden
