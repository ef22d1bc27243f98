/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/testbox-api.h"

#include <signal.h>
#include <string.h>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/result-reporter.h"
#include "src/main/tools/testbox-options.h"
#include "src/main/tools/testbox.h"

extern char** environ;

static int RunWithEnvironment(const std::vector<std::string>& args,
                              char** envp, std::string* report_json) {
  if (report_json != nullptr) report_json->clear();

  std::vector<std::string> owned;
  owned.reserve(args.size() + 1);
  owned.push_back("testbox");
  owned.insert(owned.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (auto& a : owned) argv.push_back(&a[0]);
  argv.push_back(nullptr);

  HarnessConfig config;
  if (ParseOptions(static_cast<int>(owned.size()), argv.data(), envp,
                   &config) < 0) {
    return EXIT_USAGE;
  }
  if (!config.debug_path.empty() && global_debug == nullptr &&
      EnableDebugLog(config.debug_path) < 0) {
    return EXIT_USAGE;
  }

  bool quiet = global_quiet;
  global_quiet = global_quiet || config.quiet;
  // A command that closes its pipes early must not kill the caller.
  IgnoreSignal(SIGPIPE);

  RunReport report;
  TbxRunPipeline(config, &report);
  int code = FinishRun(config, report);
  if (report_json != nullptr) *report_json = RenderJsonReport(report);
  global_quiet = quiet;
  return code;
}

int testbox_run(const std::vector<std::string>& args, std::string* report_json) {
  return RunWithEnvironment(args, environ, report_json);
}

int testbox_run_with_env(const std::vector<std::string>& args,
                         const std::vector<std::string>& env,
                         std::string* report_json) {
  std::vector<std::string> owned(env);
  std::vector<char*> envp;
  for (auto& kv : owned) envp.push_back(&kv[0]);
  envp.push_back(nullptr);
  return RunWithEnvironment(args, envp.data(), report_json);
}

std::string testbox_classify(int exit_code, int signal, bool timed_out) {
  return RunStateName(Classify(exit_code, signal, timed_out));
}

int testbox_enable_log(const std::string& path) {
  return EnableDebugLog(path);
}

int testbox_get_last_error_code() {
  return TbxGetErrorCode();
}

const char* testbox_get_last_error_msg() {
  return TbxGetErrorMsg();
}
