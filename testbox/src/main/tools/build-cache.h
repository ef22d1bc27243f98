/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_BUILD_CACHE_H_
#define SRC_MAIN_TOOLS_BUILD_CACHE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "src/main/tools/privilege-dropper.h"

#define CACHE_DIR_ENV "TESTBOX_CACHE_DIR"

uint64_t Fnv1a64(const void* data, size_t len, uint64_t seed);

// Hex key of the dependency cache for a toolchain version and a lockfile.
// Any change to either selects a different cache directory. An empty
// `lockfile` hashes the toolchain version only.
int ComputeCacheFingerprint(const std::string& toolchain_version,
                            const std::string& lockfile, std::string* out);

// Creates <cache_root>/<fingerprint> and, when the harness is root, hands it
// to `owner` so that the sandboxed command can write to it.
int PrepareCacheDirectory(const std::string& cache_root,
                          const std::string& fingerprint,
                          const TargetIdentity& owner, std::string* out);

#endif  // SRC_MAIN_TOOLS_BUILD_CACHE_H_
