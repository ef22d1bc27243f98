/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <unistd.h>
#include <assert.h>

#include <string>

#include "src/main/tools/error-handling.h"
#include "../test-utils.h"

int main() {
    SkipUnlessSandbox();
    std::string ws = MakeTempDir("testbox-e2e-");
    std::string tools = MakeTempDir("testbox-e2e-tools-");
    std::string cache = MakeTempDir("testbox-e2e-cache-");
    std::string out = MakeTempDir("testbox-e2e-out-");
    WriteTextFile(ws + "/deps.lock", "dep==2.0.0\n");
    HandWorkspaceTo(ws, "nobody");

    const std::string installer =
        "mkdir -p {prefix}/bin && "
        "printf '#!/bin/sh\\necho faketc {version}\\n' > {prefix}/bin/faketc && "
        "chmod 755 {prefix}/bin/faketc";

    // The pinned toolchain comes first on PATH, the cache is writable, and
    // only the passed-through variables are visible.
    nlohmann::json report;
    int code = RunHarness(
        {"-W", ws, "-k", "faketc@3.1.4", "-p", tools, "-I", installer,
         "-K", cache, "-L", "deps.lock", "-e", "VISIBLE", "-j", out + "/report.json",
         "-B", "faketc > build.log && echo cached > \"$TESTBOX_CACHE_DIR/marker\"",
         "-X", "grep -q 'faketc 3.1.4' build.log && test \"$VISIBLE\" = yes && "
               "test -z \"$HIDDEN\" && test -f \"$TESTBOX_CACHE_DIR/marker\" && "
               "test \"$HOME\" = /tmp && echo all good"},
        &report, {"VISIBLE=yes", "HIDDEN=secret"});
    assert(code == 0);
    assert(report["classification"] == "TestsPassed");
    assert(report["exit_code"] == 0);
    assert(report["toolchain"]["name"] == "faketc");
    assert(report["toolchain"]["version"] == "3.1.4");
    assert(report["test"]["stdout"] == "all good\n");
    assert(report["commit"]["status"] == "not_attempted");
    std::string cache_dir = report["cache_dir"];
    assert(cache_dir.compare(0, cache.size(), cache) == 0);
    assert(Trim(ReadTextFile(cache_dir + "/marker")) == "cached");

    nlohmann::json on_disk = nlohmann::json::parse(ReadTextFile(out + "/report.json"));
    assert(on_disk["classification"] == "TestsPassed");

    // The toolchain prefix is read-only inside the sandbox.
    code = RunHarness({"-W", ws, "-k", "faketc@3.1.4", "-p", tools,
                       "-X", "touch " + tools + "/faketc/3.1.4/bin/evil"},
                      &report);
    assert(code == 1);
    assert(access((tools + "/faketc/3.1.4/bin/evil").c_str(), F_OK) != 0);

    // Mismatch: the run stops before any command.
    code = RunHarness({"-W", ws, "-k", "faketc@3.1.5", "-p", tools,
                       "-I", "mkdir -p {prefix}/bin && "
                             "printf '#!/bin/sh\\necho faketc 3.1.6\\n' > {prefix}/bin/faketc && "
                             "chmod 755 {prefix}/bin/faketc",
                       "-X", "touch ran"},
                      &report);
    assert(code == 6);
    assert(report["error"]["code"] == "VersionMismatch");
    assert(report["test"]["executed"] == false);
    assert(access((ws + "/ran").c_str(), F_OK) != 0);

    // Uninstallable toolchain.
    code = RunHarness({"-W", ws, "-k", "faketc@9.9.9", "-p", tools,
                       "-I", "exit 1", "-X", "touch ran"}, &report);
    assert(code == 5);
    assert(report["error"]["code"] == "ToolchainUnavailable");

    // Unpinned version: usage error, no report.
    code = RunHarness({"-W", ws, "-k", "faketc@latest", "-X", "true"}, &report);
    assert(code == 64);
    assert(testbox_get_last_error_code() == static_cast<int>(ErrorCode::InvalidToolchainSpec));

    // Large output is capped with head and tail kept.
    code = RunHarness({"-W", ws, "-o", "1000",
                       "-X", "echo FIRST; seq 1 100000; echo LAST"}, &report);
    assert(code == 0);
    std::string s = report["test"]["stdout"];
    assert(report["test"]["stdout_truncated"] == true);
    assert(s.compare(0, 6, "FIRST\n") == 0);
    assert(s.find("LAST\n") == s.size() - 5);
    assert(s.size() < 1200);

    RemoveDirectoryTree(ws);
    RemoveDirectoryTree(tools);
    RemoveDirectoryTree(cache);
    RemoveDirectoryTree(out);
    printf("end to end ok\n");
    return 0;
}
