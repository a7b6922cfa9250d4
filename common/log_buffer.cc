// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/log_buffer.h"

#include <algorithm>

namespace warden {

LogBuffer::LogBuffer(size_t capacity) : lines_(std::max<size_t>(capacity, 1)) {}

void LogBuffer::Append(std::string line) {
  size_t capacity = lines_.size();
  if (size_ < capacity) {
    lines_[(head_ + size_) % capacity] = std::move(line);
    size_++;
    return;
  }
  // Full, overwrite the oldest.
  lines_[head_] = std::move(line);
  head_ = (head_ + 1) % capacity;
  dropped_++;
}

std::vector<std::string> LogBuffer::Tail(size_t n) const {
  size_t count = std::min(n, size_);
  std::vector<std::string> result;
  result.reserve(count);
  size_t capacity = lines_.size();
  size_t start = head_ + size_ - count;
  for (size_t i = 0; i < count; i++) {
    result.push_back(lines_[(start + i) % capacity]);
  }
  return result;
}

void LogBuffer::Clear() {
  for (auto &line : lines_) {
    line.clear();
  }
  head_ = 0;
  size_ = 0;
}

} // namespace warden
