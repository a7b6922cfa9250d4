// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace warden {

// Fixed capacity buffer holding the most recent console lines of a
// server.  When full, appending a line evicts the oldest one.
class LogBuffer {
public:
  static constexpr size_t kDefaultCapacity = 2000;

  explicit LogBuffer(size_t capacity = kDefaultCapacity);

  void Append(std::string line);

  // Returns the last min(n, Size()) lines, oldest first.
  std::vector<std::string> Tail(size_t n) const;

  void Clear();

  size_t Size() const { return size_; }
  size_t Capacity() const { return lines_.size(); }
  uint64_t Dropped() const { return dropped_; }

private:
  std::vector<std::string> lines_;
  size_t head_ = 0; // Index of the oldest line.
  size_t size_ = 0;
  uint64_t dropped_ = 0;
};

} // namespace warden
