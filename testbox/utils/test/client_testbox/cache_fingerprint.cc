/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <assert.h>

#include <string>

#include "src/main/tools/build-cache.h"
#include "src/main/tools/error-handling.h"
#include "../test-utils.h"

int main() {
    assert(Fnv1a64("", 0, 0xcbf29ce484222325ULL) == 0xcbf29ce484222325ULL);
    assert(Fnv1a64("a", 1, 0xcbf29ce484222325ULL) == 0xaf63dc4c8601ec8cULL);

    std::string dir = MakeTempDir("testbox-cache-");
    std::string lock = dir + "/deps.lock";
    WriteTextFile(lock, "libfoo==1.0.0\n");

    std::string a, b, c, d;
    assert(ComputeCacheFingerprint("1.21.0", lock, &a) == 0);
    assert(ComputeCacheFingerprint("1.21.0", lock, &b) == 0);
    assert(a == b);
    assert(a.size() == 16);

    // A new toolchain or a new lockfile selects a fresh cache.
    assert(ComputeCacheFingerprint("1.21.1", lock, &c) == 0);
    assert(c != a);
    WriteTextFile(lock, "libfoo==1.0.1\n");
    assert(ComputeCacheFingerprint("1.21.0", lock, &d) == 0);
    assert(d != a);

    TbxClearError();
    assert(ComputeCacheFingerprint("1.21.0", dir + "/missing.lock", &d) < 0);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::PathDoesNotExist));

    TargetIdentity owner;
    std::string cache;
    assert(PrepareCacheDirectory(dir + "/cache", a, owner, &cache) == 0);
    assert(cache == dir + "/cache/" + a);
    struct stat st;
    assert(stat(cache.c_str(), &st) == 0 && S_ISDIR(st.st_mode));
    assert(PrepareCacheDirectory("relative", a, owner, &cache) < 0);

    RemoveDirectoryTree(dir);
    printf("cache fingerprint ok\n");
    return 0;
}
