/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <dirent.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <assert.h>

#include <string>

#include "../test-utils.h"

// True while any process on the host has `marker` in its command line.
static bool ProcessWithArgumentExists(const std::string& marker) {
    DIR* proc = opendir("/proc");
    if (proc == nullptr) return false;
    bool found = false;
    struct dirent* e;
    while (!found && (e = readdir(proc)) != nullptr) {
        if (e->d_name[0] < '0' || e->d_name[0] > '9') continue;
        std::string cmdline = ReadTextFile(std::string("/proc/") + e->d_name + "/cmdline");
        for (auto& ch : cmdline) if (ch == '\0') ch = ' ';
        if (cmdline.find(marker) != std::string::npos &&
            cmdline.find("testbox") == std::string::npos) {
            found = true;
        }
    }
    closedir(proc);
    return found;
}

int main() {
    SkipUnlessSandbox();
    std::string ws = MakeTempDir("testbox-timeout-");
    HandWorkspaceTo(ws, "nobody");

    int64_t start = MonotonicMillis();
    nlohmann::json report;
    // The background sleeper must die with the group, not outlive the run.
    int code = RunHarness({"-W", ws, "-T", "1", "-t", "1",
                           "-X", "sleep 97.25 & echo started; sleep 96.5"},
                          &report);
    int64_t elapsed = MonotonicMillis() - start;
    assert(code == 3);
    assert(report["classification"] == "Timeout");
    assert(report["test"]["timed_out"] == true);
    assert(report["test"]["stdout"] == "started\n");
    assert(elapsed < 15000);
    assert(!ProcessWithArgumentExists("97.25"));
    assert(!ProcessWithArgumentExists("96.5"));

    // Closing both output streams does not stop the clock.
    start = MonotonicMillis();
    code = RunHarness({"-W", ws, "-T", "1",
                       "-X", "exec >/dev/null 2>&1; sleep 6"}, &report);
    elapsed = MonotonicMillis() - start;
    assert(code == 3);
    assert(report["classification"] == "Timeout");
    assert(report["test"]["timed_out"] == true);
    assert(elapsed < 5000);

    // A timed-out build stops the run before the tests.
    code = RunHarness({"-W", ws, "-T", "1", "-B", "sleep 30",
                       "-X", "touch tests-ran"}, &report);
    assert(code == 2);
    assert(report["build"]["classification"] == "Timeout");
    assert(access((ws + "/tests-ran").c_str(), F_OK) != 0);

    // A command ignoring SIGTERM is still killed after the grace period.
    code = RunHarness({"-W", ws, "-T", "1", "-t", "1",
                       "-X", "trap '' TERM; sleep 30"}, &report);
    assert(code == 3);

    RemoveDirectoryTree(ws);
    printf("timeout ok\n");
    return 0;
}
