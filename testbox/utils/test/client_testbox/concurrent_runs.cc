/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include <string>
#include <thread>

#include "src/main/tools/logging.h"
#include "../test-utils.h"

int main() {
    if (!HaveNobody()) {
        printf("no nobody user, skipping\n");
        return SKIP_TEST;
    }
    std::string ws = MakeTempDir("testbox-concurrent-");
    std::string root = MakeTempDir("testbox-concurrent-tools-");
    std::vector<std::string> env = {"PATH=/usr/local/bin:/usr/bin:/bin"};

    // -q on one thread leaves the other threads' setting alone.
    global_quiet = false;
    std::thread quiet_run([&]() {
        std::string json;
        testbox_run_with_env({"-q", "-W", ws, "-u", "no-such-user-here",
                              "-X", "true"}, env, &json);
        assert(!global_quiet);
    });
    quiet_run.join();
    assert(!global_quiet);

    // Cancellation stops host commands too, and no later run clears it.
    RequestCancellation();
    for (int i = 0; i < 2; ++i) {
        int64_t start = MonotonicMillis();
        std::string json;
        int code = testbox_run_with_env(
            {"-q", "-W", ws, "-k", "slowtool@1.0.0", "-p", root,
             "-I", "sleep 30", "-X", "true"},
            env, &json);
        int64_t elapsed = MonotonicMillis() - start;
        printf("run %d: exit %d after %lld ms\n", i, code,
               static_cast<long long>(elapsed));
        assert(code == 5);
        assert(elapsed < 10000);
        assert(CancellationRequested());
    }

    RemoveDirectoryTree(root);
    RemoveDirectoryTree(ws);
    printf("concurrent runs ok\n");
    return 0;
}
