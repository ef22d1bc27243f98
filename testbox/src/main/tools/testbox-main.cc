/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include <signal.h>
#include <stdio.h>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/result-reporter.h"
#include "src/main/tools/testbox-options.h"
#include "src/main/tools/testbox.h"

static void OnTerminationSignal(int) {
  RequestCancellation();
}

int main(int argc, char *argv[], char *envp[]) {
  HarnessConfig config;
  if (ParseOptions(argc, argv, envp, &config) < 0) {
    fprintf(stderr, "testbox: %s\n", TbxGetErrorMsg());
    return ExitCodeForError(static_cast<ErrorCode>(TbxGetErrorCode()));
  }
  global_quiet = config.quiet;
  if (!config.debug_path.empty() && EnableDebugLog(config.debug_path) < 0) {
    fprintf(stderr, "testbox: %s\n", TbxGetErrorMsg());
    return EXIT_USAGE;
  }
  logSystem();

  IgnoreSignal(SIGPIPE);
  InstallSignalHandler(SIGINT, OnTerminationSignal);
  InstallSignalHandler(SIGTERM, OnTerminationSignal);

  RunReport report;
  TbxRunPipeline(config, &report);
  int exit_code = FinishRun(config, report);
  CloseDebugLog();
  return exit_code;
}
