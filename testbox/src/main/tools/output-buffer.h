/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_OUTPUT_BUFFER_H_
#define SRC_MAIN_TOOLS_OUTPUT_BUFFER_H_

#include <stddef.h>

#include <string>

#define DEFAULT_OUTPUT_LIMIT (1024 * 1024)
#define TRUNCATION_MARKER_FMT "\n[testbox: output truncated, %zu bytes omitted]\n"

// Captures one output stream of a sandboxed command without growing past
// `limit` bytes. Once the limit is hit the first half of the limit is kept
// verbatim, the most recent half is kept in a rolling tail, and everything
// in between is replaced by a truncation marker.
class OutputBuffer {
 public:
  explicit OutputBuffer(size_t limit = DEFAULT_OUTPUT_LIMIT);

  void Append(const char* data, size_t len);

  // Head, marker (if anything was dropped) and tail.
  std::string Contents() const;

  bool truncated() const { return total_ > head_limit_ + tail_limit_; }
  size_t dropped() const {
    return truncated() ? total_ - head_limit_ - tail_limit_ : 0;
  }
  size_t total() const { return total_; }

 private:
  void TrimTail();

  size_t head_limit_;
  size_t tail_limit_;
  std::string head_;
  std::string tail_;
  size_t total_;
};

#endif  // SRC_MAIN_TOOLS_OUTPUT_BUFFER_H_
