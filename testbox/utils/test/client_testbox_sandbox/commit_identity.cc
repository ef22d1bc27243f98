/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <assert.h>

#include <string>

#include "src/main/tools/commit-agent.h"
#include "src/main/tools/error-handling.h"
#include "../test-utils.h"

int main() {
    SkipUnlessSandbox();
    if (!HaveGit()) {
        printf("git not installed, skipping\n");
        return SKIP_TEST;
    }
    std::string ws = MakeTempDir("testbox-commit-");
    InitGitRepo(ws);
    HandWorkspaceTo(ws, "nobody");

    // The invoker's identity is everywhere the agent could pick it up from.
    setenv("GIT_AUTHOR_NAME", "Invoking Human", 1);
    setenv("GIT_AUTHOR_EMAIL", "human@example.com", 1);
    setenv("GIT_COMMITTER_NAME", "Invoking Human", 1);
    setenv("GIT_COMMITTER_EMAIL", "human@example.com", 1);
    setenv("EMAIL", "human@example.com", 1);
    std::string home = MakeTempDir("testbox-home-");
    WriteTextFile(home + "/.gitconfig",
                  "[user]\n\tname = Invoking Human\n\temail = human@example.com\n");
    setenv("HOME", home.c_str(), 1);

    AutomationIdentity identity;
    TargetIdentity target;
    assert(ResolveTargetUser("nobody", "", &target) == 0);
    SandboxPolicy policy = SystemRootsPolicy();
    const GitSandbox git = {&policy, &target, "/usr/local/bin:/usr/bin:/bin"};

    std::vector<std::string> env = GitEnvironment(identity, git.path);
    bool saw_author = false;
    for (const auto& kv : env) {
        assert(kv.find("human@example.com") == std::string::npos);
        if (kv == "GIT_AUTHOR_NAME=" DEFAULT_AUTOMATION_NAME) saw_author = true;
    }
    assert(saw_author);

    CommitReport report;
    assert(CommitWorkspace(ws, identity, "", git, &report) == 0);
    assert(report.status == CommitStatus::NoChanges);
    assert(RunGitIn(ws, "rev-list --count HEAD") == "1");

    WriteTextFile(ws + "/fixed.txt", "auto-fix\n");
    assert(CommitWorkspace(ws, identity, "apply fixes", git, &report) == 0);
    assert(report.status == CommitStatus::Committed);
    assert(report.commit_id.size() == 40);
    assert(RunGitIn(ws, "rev-parse HEAD") == report.commit_id);
    assert(RunGitIn(ws, "log -1 --format=%an") == DEFAULT_AUTOMATION_NAME);
    assert(RunGitIn(ws, "log -1 --format=%ae") == DEFAULT_AUTOMATION_EMAIL);
    assert(RunGitIn(ws, "log -1 --format=%cn") == DEFAULT_AUTOMATION_NAME);
    assert(RunGitIn(ws, "log -1 --format=%ce") == DEFAULT_AUTOMATION_EMAIL);
    assert(RunGitIn(ws, "log -1 --format=%s") == "apply fixes");

    // Custom automation identity.
    identity.committer_name = "ci-committer";
    identity.committer_email = "ci@example.org";
    WriteTextFile(ws + "/fixed.txt", "auto-fix 2\n");
    assert(CommitWorkspace(ws, identity, "more", git, &report) == 0);
    assert(RunGitIn(ws, "log -1 --format=%cn") == "ci-committer");
    assert(RunGitIn(ws, "log -1 --format=%an") == DEFAULT_AUTOMATION_NAME);

    // Not a repository: recoverable CommitFailed.
    std::string plain = MakeTempDir("testbox-norepo-");
    WriteTextFile(plain + "/x", "x");
    HandWorkspaceTo(plain, "nobody");
    TbxClearError();
    assert(CommitWorkspace(plain, identity, "", git, &report) < 0);
    assert(report.status == CommitStatus::Failed);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::CommitFailed));
    assert(IsRecoverable(ErrorCode::CommitFailed));

    RemoveDirectoryTree(ws);
    RemoveDirectoryTree(home);
    RemoveDirectoryTree(plain);
    printf("commit identity ok\n");
    return 0;
}
