/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <unistd.h>
#include <assert.h>

#include <string>

#include "../test-utils.h"

int main() {
    SkipUnlessSandbox();
    std::string ws = MakeTempDir("testbox-build-");
    HandWorkspaceTo(ws, "nobody");

    nlohmann::json report;
    int code = RunHarness({"-W", ws, "-B", "echo compiling; exit 2",
                           "-X", "touch tests-ran"}, &report);
    assert(code == 2);
    assert(report["classification"] == "BuildFailed");
    assert(report["build"]["executed"] == true);
    assert(report["build"]["exit_code"] == 2);
    assert(report["build"]["stdout"] == "compiling\n");
    assert(report["test"]["executed"] == false);
    assert(access((ws + "/tests-ran").c_str(), F_OK) != 0);

    // A build killed by a signal is a build failure too.
    code = RunHarness({"-W", ws, "-B", "kill -SEGV $$", "-X", "true"}, &report);
    assert(code == 2);
    assert(report["build"]["classification"] == "Crashed");
    assert(report["test"]["executed"] == false);

    // A passing build hands over to the tests, which see its output.
    code = RunHarness({"-W", ws, "-B", "echo built > artifact",
                       "-X", "grep -q built artifact"}, &report);
    assert(code == 0);
    assert(report["classification"] == "TestsPassed");

    code = RunHarness({"-W", ws, "-X", "echo 3 failures >&2; exit 1"}, &report);
    assert(code == 1);
    assert(report["classification"] == "TestsFailed");
    assert(report["test"]["stderr"] == "3 failures\n");
    assert(report["build"]["executed"] == false);

    RemoveDirectoryTree(ws);
    printf("build failure ok\n");
    return 0;
}
