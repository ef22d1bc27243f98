/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/test-executor.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

static int RunStep(const char* name, const SandboxPolicy& policy,
                   const TargetIdentity& target,
                   const ExecutionRequest& request, StepReport* step,
                   RunReport* report) {
  PRINT_INFO("%s: %s", name, request.command.c_str());
  int rc = LaunchSandboxed(policy, target, request, &step->result);
  if (rc < 0) {
    const TbxError err = TbxGetLastError();
    report->setup_error = err.code;
    report->setup_error_msg = err.msg;
    PRINT_INFO("%s could not be started: %s", name, err.msg);
    return rc;
  }
  step->executed = true;
  step->classification = ClassifyResult(step->result);
  PRINT_INFO("%s finished: %s", name, RunStateName(step->classification));
  return 0;
}


int ExecuteBuildAndTest(const SandboxPolicy& policy,
                        const TargetIdentity& target,
                        const ExecutionRequest& build,
                        const ExecutionRequest& test, RunReport* report) {
  report->state = RunState::Pending;

  if (!build.command.empty()) {
    report->state = RunState::Building;
    int rc = RunStep("build", policy, target, build, &report->build, report);
    if (rc < 0) return rc;
    if (report->build.classification != RunState::TestsPassed) {
      report->state = RunState::BuildFailed;
      return 0;
    }
  }

  report->state = RunState::Testing;
  int rc = RunStep("test", policy, target, test, &report->test, report);
  if (rc < 0) return rc;
  report->state = report->test.classification;
  return 0;
}
