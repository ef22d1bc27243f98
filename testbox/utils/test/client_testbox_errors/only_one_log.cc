/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <unistd.h>
#include <assert.h>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/testbox-api.h"

int main() {
    printf("starting program pid=%d\n", getpid());

    assert(testbox_enable_log("/tmp/testbox-only-one-log.txt") == 0);
    assert(testbox_enable_log("/tmp/testbox-only-one-log-2.txt") < 0);
    int err_code = testbox_get_last_error_code();
    assert(err_code == static_cast<int>(ErrorCode::LogFileNotUnique));
    unlink("/tmp/testbox-only-one-log.txt");
    return 0;
}
