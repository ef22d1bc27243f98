/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_TEST_EXECUTOR_H_
#define SRC_MAIN_TOOLS_TEST_EXECUTOR_H_

#include "src/main/tools/result-reporter.h"
#include "src/main/tools/sandbox.h"

// Runs the build step, when `build.command` is set, then the test step, each
// in a fresh sandbox over the same workspace, and moves report->state through
// Building and Testing to a terminal state. An unsuccessful build (non-zero
// exit, signal or timeout) ends the run in BuildFailed without starting the
// tests. Returns a negative value, with the error also stored in `report`,
// when a sandbox could not be set up.
int ExecuteBuildAndTest(const SandboxPolicy& policy,
                        const TargetIdentity& target,
                        const ExecutionRequest& build,
                        const ExecutionRequest& test, RunReport* report);

#endif  // SRC_MAIN_TOOLS_TEST_EXECUTOR_H_
