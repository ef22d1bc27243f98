/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_TESTBOX_H_
#define SRC_MAIN_TOOLS_TESTBOX_H_

#include <string>
#include <vector>

#include "src/main/tools/result-reporter.h"
#include "src/main/tools/testbox-options.h"

// Runs one invocation end to end: pin the toolchain, prepare the cache,
// build and test in the sandbox, then commit if asked to and the tests
// passed. Fatal setup errors are recorded in `report` and returned as a
// negative value before any untrusted command runs.
int TbxRunPipeline(const HarnessConfig& config, RunReport* report);

// The environment both sandboxed commands get.
std::vector<std::string> BuildSandboxEnvironment(const HarnessConfig& config,
                                                 const std::string& tool_bin,
                                                 const std::string& cache_dir);

// Prints the summary, writes the JSON report if one was requested and returns
// the process exit code for `report`.
int FinishRun(const HarnessConfig& config, const RunReport& report);

#endif  // SRC_MAIN_TOOLS_TESTBOX_H_
