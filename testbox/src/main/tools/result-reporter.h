/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_RESULT_REPORTER_H_
#define SRC_MAIN_TOOLS_RESULT_REPORTER_H_

#include <stdio.h>

#include <string>

#include "src/main/tools/commit-agent.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/sandbox.h"

enum class RunState {
  Pending,
  Building,
  Testing,
  BuildFailed,
  TestsPassed,
  TestsFailed,
  Timeout,
  Crashed
};

// Process exit codes of a run.
#define EXIT_TESTS_PASSED 0
#define EXIT_TESTS_FAILED 1
#define EXIT_BUILD_FAILED 2
#define EXIT_TIMEOUT 3
#define EXIT_CRASHED 4
#define EXIT_TOOLCHAIN_UNAVAILABLE 5
#define EXIT_VERSION_MISMATCH 6
#define EXIT_SANDBOX_SETUP 7
#define EXIT_PRIVILEGE_DROP 8
#define EXIT_USAGE 64

const char* RunStateName(RunState state);
bool IsTerminal(RunState state);

// Total: timed out -> Timeout, else signal -> Crashed, else exit 0 ->
// TestsPassed, else TestsFailed.
RunState Classify(int exit_code, int signal, bool timed_out);
RunState ClassifyResult(const ExecutionResult& result);

struct StepReport {
  bool executed = false;
  ExecutionResult result;
  // Classification of this step alone.
  RunState classification = RunState::Pending;
};

struct RunReport {
  RunState state = RunState::Pending;
  StepReport build;
  StepReport test;
  std::string toolchain_name;
  std::string toolchain_version;
  std::string toolchain_prefix;
  std::string cache_dir;
  CommitReport commit;
  // Set when the run aborted before a classification was reached.
  ErrorCode setup_error = ErrorCode::None;
  std::string setup_error_msg;
};

int ExitCodeForState(RunState state);
int ExitCodeForError(ErrorCode code);
// Exit code of the whole run. Commit failures never change it.
int ExitCodeForReport(const RunReport& report);

std::string RenderJsonReport(const RunReport& report);
int WriteJsonReport(const RunReport& report, const std::string& path);

// One human readable block per run.
void PrintSummary(const RunReport& report, FILE* out);

#endif  // SRC_MAIN_TOOLS_RESULT_REPORTER_H_
