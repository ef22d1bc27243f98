/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <signal.h>
#include <stdio.h>
#include <assert.h>

#include <string>

#include "../test-utils.h"

int main() {
    CommandResult res;
    assert(RunCommand({"/bin/sh", "-c", "echo out; echo err >&2; exit 4"}, {},
                      "/", 10, &res) == 0);
    assert(res.exit_code == 4);
    assert(!res.timed_out);
    assert(res.output == "out\nerr\n");

    // A command that closes its output is still bound by the timeout.
    int64_t start = MonotonicMillis();
    res = CommandResult();
    assert(RunCommand({"/bin/sh", "-c", "exec >/dev/null 2>&1; sleep 6"}, {},
                      "/", 1, &res) == 0);
    int64_t elapsed = MonotonicMillis() - start;
    assert(res.timed_out);
    assert(res.signal == SIGKILL);
    assert(elapsed < 5000);

    // Exiting with the output closed is noticed without waiting for the
    // timeout.
    start = MonotonicMillis();
    res = CommandResult();
    assert(RunCommand({"/bin/sh", "-c", "exec >&-; exec 2>&-; sleep 1; exit 2"},
                      {}, "/", 30, &res) == 0);
    assert(res.exit_code == 2);
    assert(!res.timed_out);
    assert(MonotonicMillis() - start < 10000);

    assert(RunCommand({"no-such-command-anywhere"}, {"PATH=/usr/bin:/bin"},
                      "/", 1, &res) < 0);

    printf("run command ok\n");
    return 0;
}
