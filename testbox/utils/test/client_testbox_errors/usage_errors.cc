/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include <string>
#include <vector>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/testbox-api.h"

int main() {
    std::string report = "stale";
    std::vector<std::string> env = {"PATH=/usr/bin:/bin"};

    assert(testbox_run_with_env({"-W", "/tmp", "-Z", "-X", "true"}, env, &report) == 64);
    assert(report.empty());
    assert(testbox_run_with_env({"-W", "/tmp", "-T"}, env, &report) == 64);
    assert(testbox_run_with_env({"-W", "/nonexistent/ws", "-X", "true"}, env, &report) == 64);
    assert(testbox_get_last_error_code() == static_cast<int>(ErrorCode::PathDoesNotExist));
    assert(testbox_run_with_env({"-W", "/tmp", "-k", "go", "-X", "true"}, env, &report) == 64);
    assert(testbox_run_with_env({"-W", "/tmp", "-o", "0", "-X", "true"}, env, &report) == 64);
    assert(testbox_run_with_env({"-W", "/tmp", "-L", "deps.lock", "-X", "true"}, env, &report) == 64);
    assert(testbox_run_with_env({"-W", "/tmp", "-X", "true"},
                                {"TESTBOX_ISOLATION=chroot"}, &report) == 64);
    printf("usage errors ok\n");
    return 0;
}
