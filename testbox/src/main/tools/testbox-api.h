/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

// This header contains the APIs for C++ only and thus we can
// use std::string and std::vector

#ifndef SRC_MAIN_TOOLS_TESTBOX_API_H_
#define SRC_MAIN_TOOLS_TESTBOX_API_H_

#include <string>
#include <vector>

// Runs one harness invocation. `args` are the command-line options, without
// the program name, and are applied on top of the TESTBOX_* variables of the
// calling process. Returns the exit code the testbox binary would return and
// stores the JSON report in `report_json` when it is not null. Invalid
// options return 64 with an empty report.
int testbox_run(const std::vector<std::string>& args, std::string* report_json);

// Same as testbox_run but reads configuration from `env` (KEY=VALUE) instead
// of the process environment.
int testbox_run_with_env(const std::vector<std::string>& args,
                         const std::vector<std::string>& env,
                         std::string* report_json);

// Classification name for a finished command: TestsPassed, TestsFailed,
// Timeout or Crashed.
std::string testbox_classify(int exit_code, int signal, bool timed_out);

// Enables logging at a certain path. Only one log per process.
int testbox_enable_log(const std::string& path);

// Returns error code and error messages of the last failure.
int testbox_get_last_error_code();
const char* testbox_get_last_error_msg();

#endif  // SRC_MAIN_TOOLS_TESTBOX_API_H_
