/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/output-buffer.h"

#include <stdio.h>

#include <algorithm>
#include <vector>


OutputBuffer::OutputBuffer(size_t limit)
    : head_limit_(limit - limit / 2),
      tail_limit_(limit / 2),
      total_(0) {}


void OutputBuffer::Append(const char* data, size_t len) {
  total_ += len;

  const size_t head_room = head_limit_ - head_.size();
  const size_t to_head = std::min(head_room, len);
  head_.append(data, to_head);
  data += to_head;
  len -= to_head;
  if (len == 0) return;

  tail_.append(data, len);
  // Only compact once the tail is twice its budget, so that a stream of
  // small writes does not move the whole tail on every call.
  if (tail_.size() > 2 * tail_limit_ + 4096) {
    TrimTail();
  }
}


void OutputBuffer::TrimTail() {
  if (tail_.size() <= tail_limit_) return;
  tail_.erase(0, tail_.size() - tail_limit_);
}


std::string OutputBuffer::Contents() const {
  const size_t tail_begin =
      tail_.size() > tail_limit_ ? tail_.size() - tail_limit_ : 0;
  const size_t omitted = dropped();

  std::string out(head_);
  if (omitted > 0) {
    std::vector<char> marker(128);
    int n = snprintf(marker.data(), marker.size(), TRUNCATION_MARKER_FMT, omitted);
    if (n > 0) {
      out.append(marker.data(), std::min(static_cast<size_t>(n), marker.size() - 1));
    }
  }
  out.append(tail_, tail_begin, std::string::npos);
  return out;
}
