/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>
#include <assert.h>

#include <string>

#include "../test-utils.h"

int main() {
    SkipUnlessSandbox();
    if (!HaveGit()) {
        printf("git not installed, skipping\n");
        return SKIP_TEST;
    }
    std::string ws = MakeTempDir("testbox-commit-run-");
    InitGitRepo(ws);
    HandWorkspaceTo(ws, "nobody");
    std::string head = RunGitIn(ws, "rev-parse HEAD");

    // Tests pass and touch nothing: no commit.
    nlohmann::json report;
    int code = RunHarness({"-W", ws, "-c", "-X", "true"}, &report,
                          {"GIT_AUTHOR_NAME=Someone Else", "USER=someone"});
    assert(code == 0);
    assert(report["commit"]["status"] == "no_changes");
    assert(RunGitIn(ws, "rev-parse HEAD") == head);

    // Tests fail after changing files: nothing is committed.
    code = RunHarness({"-W", ws, "-c", "-X", "echo broken > fix.txt; exit 1"}, &report);
    assert(code == 1);
    assert(report["commit"]["status"] == "not_attempted");
    assert(RunGitIn(ws, "rev-parse HEAD") == head);

    // Passing run with an auto-fix: committed as the automation identity.
    code = RunHarness({"-W", ws, "-c", "-m", "auto-fix from tests",
                       "-X", "echo fixed > fix.txt"},
                      &report,
                      {"GIT_AUTHOR_NAME=Someone Else", "GIT_AUTHOR_EMAIL=else@example.com",
                       "TESTBOX_AUTHOR_NAME=fixer-bot",
                       "TESTBOX_AUTHOR_EMAIL=fixer-bot@example.org"});
    assert(code == 0);
    assert(report["commit"]["status"] == "committed");
    assert(report["commit"]["id"] == RunGitIn(ws, "rev-parse HEAD"));
    assert(RunGitIn(ws, "log -1 --format=%an") == "fixer-bot");
    assert(RunGitIn(ws, "log -1 --format=%ae") == "fixer-bot@example.org");
    assert(RunGitIn(ws, "log -1 --format=%cn") == "testbox-bot");
    assert(RunGitIn(ws, "log -1 --format=%s") == "auto-fix from tests");
    assert(RunGitIn(ws, "show --format= --name-only HEAD") == "fix.txt");

    // The tests plant a clean filter that would write to a directory only the
    // host can see. Git runs in the sandbox, so the filter cannot reach it.
    std::string host_only = MakeTempDir("testbox-host-only-");
    chmod(host_only.c_str(), 0777);
    std::string marker = host_only + "/filter-ran";
    std::string plant =
        "printf '[filter \"x\"]\\n\\tclean = \"id -u > " + marker +
        "; cat\"\\n' >> .git/config && echo '* filter=x' > .gitattributes && "
        "echo data > filtered.txt";
    code = RunHarness({"-W", ws, "-c", "-X", plant}, &report);
    assert(code == 0);
    assert(report["commit"]["status"] == "committed");
    assert(access(marker.c_str(), F_OK) != 0);

    RemoveDirectoryTree(host_only);
    RemoveDirectoryTree(ws);
    printf("commit after run ok\n");
    return 0;
}
