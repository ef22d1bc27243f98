/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <signal.h>
#include <string.h>
#include <assert.h>

#include "src/main/tools/result-reporter.h"
#include "src/main/tools/testbox-api.h"

int main() {
    // Every (exit code, signal, timed out) triple lands on exactly one
    // terminal state, and the precedence is timeout, then signal, then code.
    const int codes[] = {0, 1, 2, 42, 127, 255};
    const int signals[] = {0, SIGSEGV, SIGKILL, SIGABRT};
    for (int code : codes) {
        for (int sig : signals) {
            for (int timed_out = 0; timed_out < 2; timed_out++) {
                RunState s = Classify(code, sig, timed_out != 0);
                assert(IsTerminal(s));
                if (timed_out) {
                    assert(s == RunState::Timeout);
                } else if (sig != 0) {
                    assert(s == RunState::Crashed);
                } else if (code == 0) {
                    assert(s == RunState::TestsPassed);
                } else {
                    assert(s == RunState::TestsFailed);
                }
            }
        }
    }
    assert(!IsTerminal(RunState::Pending));
    assert(!IsTerminal(RunState::Building));
    assert(!IsTerminal(RunState::Testing));
    assert(IsTerminal(RunState::BuildFailed));

    assert(ExitCodeForState(RunState::TestsPassed) == 0);
    assert(ExitCodeForState(RunState::TestsFailed) == 1);
    assert(ExitCodeForState(RunState::BuildFailed) == 2);
    assert(ExitCodeForState(RunState::Timeout) == 3);
    assert(ExitCodeForState(RunState::Crashed) == 4);
    assert(ExitCodeForError(ErrorCode::ToolchainUnavailable) == 5);
    assert(ExitCodeForError(ErrorCode::VersionMismatch) == 6);
    assert(ExitCodeForError(ErrorCode::SandboxSetupError) == 7);
    assert(ExitCodeForError(ErrorCode::PrivilegeDropFailed) == 8);
    assert(ExitCodeForError(ErrorCode::InvalidToolchainSpec) == 64);

    // A failed commit never overrides the classification.
    RunReport report;
    report.state = RunState::TestsPassed;
    report.commit.status = CommitStatus::Failed;
    report.commit.error = "git exploded";
    assert(ExitCodeForReport(report) == 0);
    assert(IsRecoverable(ErrorCode::CommitFailed));
    assert(!IsRecoverable(ErrorCode::SandboxSetupError));

    report = RunReport();
    report.setup_error = ErrorCode::VersionMismatch;
    assert(ExitCodeForReport(report) == 6);

    assert(testbox_classify(0, 0, false) == "TestsPassed");
    assert(testbox_classify(3, 0, false) == "TestsFailed");
    assert(testbox_classify(0, SIGSEGV, false) == "Crashed");
    assert(testbox_classify(0, 0, true) == "Timeout");

    printf("classification ok\n");
    return 0;
}
