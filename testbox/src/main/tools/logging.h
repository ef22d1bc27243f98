// Copyright 2015 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_LOGGING_H_
#define SRC_MAIN_TOOLS_LOGGING_H_

#include <inttypes.h>
#include <stdio.h>
#include <time.h>

#include <string>

// Debug output goes here when a debug log was requested (-D), nowhere
// otherwise.
extern FILE *global_debug;

// Suppresses PRINT_INFO progress messages (-q). Per thread, so that library
// runs on different threads keep their own setting.
extern thread_local bool global_quiet;

// Writes a timestamped message to the debug log.
#define PRINT_DEBUG(fmt, ...)                                                  \
  do {                                                                         \
    if (global_debug != nullptr) {                                             \
      struct timespec ts;                                                      \
      clock_gettime(CLOCK_REALTIME, &ts);                                      \
      fprintf(global_debug, "%" PRId64 ".%09ld: %s:%d: " fmt "\n",             \
              static_cast<int64_t>(ts.tv_sec), ts.tv_nsec, __FILE__, __LINE__, \
              ##__VA_ARGS__);                                                  \
      fflush(global_debug);                                                    \
    }                                                                          \
  } while (false)

// Writes a progress message to stderr, and to the debug log if there is one.
#define PRINT_INFO(fmt, ...)                                                   \
  do {                                                                         \
    if (!global_quiet) {                                                       \
      fprintf(stderr, "testbox: " fmt "\n", ##__VA_ARGS__);                    \
    }                                                                          \
    PRINT_DEBUG(fmt, ##__VA_ARGS__);                                           \
  } while (false)

// Opens the debug log. Only one log per process.
int EnableDebugLog(const std::string &path);

// Flushes and closes the debug log, if any.
void CloseDebugLog();

// Records kernel, distribution, libc and libstdc++ versions in the debug log.
void logSystem();

#endif  // SRC_MAIN_TOOLS_LOGGING_H_
