/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/build-cache.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <stdio.h>
#include <unistd.h>

#include <fstream>
#include <sstream>

#define FNV64_OFFSET_BASIS 0xcbf29ce484222325ULL
#define FNV64_PRIME 0x100000001b3ULL

uint64_t Fnv1a64(const void* data, size_t len, uint64_t seed) {
  const unsigned char* p = static_cast<const unsigned char*>(data);
  uint64_t hash = seed;
  for (size_t i = 0; i < len; i++) {
    hash ^= p[i];
    hash *= FNV64_PRIME;
  }
  return hash;
}


int ComputeCacheFingerprint(const std::string& toolchain_version,
                            const std::string& lockfile, std::string* out) {
  // The separator keeps "1.2" + "3x" and "1.23" + "x" apart.
  std::string material = "toolchain=" + toolchain_version + '\0';
  if (!lockfile.empty()) {
    std::ifstream in(lockfile, std::ios::binary);
    if (!in.is_open()) {
      return TbxReportErrorAndMessage("lockfile " + lockfile,
                                      ErrorCode::PathDoesNotExist);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    material += "lockfile=" + contents.str();
  }

  char hex[17];
  snprintf(hex, sizeof(hex), "%016llx",
           static_cast<unsigned long long>(
               Fnv1a64(material.data(), material.size(), FNV64_OFFSET_BASIS)));
  *out = hex;
  PRINT_DEBUG("cache fingerprint %s (toolchain %s, lockfile %s)", hex,
              toolchain_version.c_str(),
              lockfile.empty() ? "<none>" : lockfile.c_str());
  return 0;
}


int PrepareCacheDirectory(const std::string& cache_root,
                          const std::string& fingerprint,
                          const TargetIdentity& owner, std::string* out) {
  if (cache_root.empty() || cache_root[0] != '/') {
    return TbxReportErrorAndMessage("cache root " + cache_root,
                                    ErrorCode::NotAnAbsolutePath);
  }
  const std::string dir = cache_root + "/" + fingerprint;
  if (CreateDirectories(dir) < 0) return UNRECOVERABLE_FAIL;
  if (geteuid() == 0 && chown(dir.c_str(), owner.uid, owner.gid) < 0) {
    return TbxReportSysError("chown(" + dir + ")");
  }
  *out = dir;
  PRINT_DEBUG("dependency cache %s", dir.c_str());
  return 0;
}
