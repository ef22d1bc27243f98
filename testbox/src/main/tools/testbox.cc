/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/testbox.h"

#include <stdio.h>
#include <string.h>

#include "src/main/tools/build-cache.h"
#include "src/main/tools/commit-agent.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/privilege-dropper.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/test-executor.h"
#include "src/main/tools/toolchain-pinner.h"

#define SANDBOX_HOME "/tmp"

static int RecordSetupError(RunReport* report) {
  const TbxError err = TbxGetLastError();
  report->setup_error = err.code;
  report->setup_error_msg = err.msg;
  PRINT_INFO("%s", err.msg);
  return static_cast<int>(err.code) < 0 ? static_cast<int>(err.code) : -1;
}

static bool HasVariable(const std::vector<std::string>& env,
                        const std::string& name, std::string* value) {
  const std::string prefix = name + "=";
  for (const auto& kv : env) {
    if (kv.compare(0, prefix.size(), prefix) == 0) {
      if (value != nullptr) *value = kv.substr(prefix.size());
      return true;
    }
  }
  return false;
}

std::vector<std::string> BuildSandboxEnvironment(const HarnessConfig& config,
                                                 const std::string& tool_bin,
                                                 const std::string& cache_dir) {
  std::vector<std::string> env;
  std::string path = DEFAULT_SANDBOX_PATH;
  HasVariable(config.env, "PATH", &path);
  if (!tool_bin.empty()) {
    path = tool_bin + ":" + path;
  }
  env.push_back("PATH=" + path);
  if (!HasVariable(config.env, "HOME", nullptr)) {
    env.push_back("HOME=" SANDBOX_HOME);
  }
  if (!cache_dir.empty()) {
    env.push_back(std::string(CACHE_DIR_ENV) + "=" + cache_dir);
  }
  for (const auto& kv : config.env) {
    if (kv.compare(0, 5, "PATH=") == 0) continue;
    if (!cache_dir.empty() &&
        kv.compare(0, strlen(CACHE_DIR_ENV) + 1,
                   std::string(CACHE_DIR_ENV) + "=") == 0) {
      continue;
    }
    env.push_back(kv);
  }
  return env;
}

int TbxRunPipeline(const HarnessConfig& config, RunReport* report) {
  *report = RunReport();
  TbxClearError();

  TargetIdentity target;
  if (ResolveTargetUser(config.policy.user, config.policy.group, &target) < 0) {
    return RecordSetupError(report);
  }
  PRINT_DEBUG("commands run as %s (%d:%d)", target.name.c_str(),
              static_cast<int>(target.uid), static_cast<int>(target.gid));

  SandboxPolicy policy = config.policy;

  PinnedToolchain pinned;
  if (config.have_toolchain) {
    report->toolchain_name = config.toolchain.name;
    PRINT_INFO("pinning %s %s", config.toolchain.name.c_str(),
               config.toolchain.version.c_str());
    if (PinToolchain(config.toolchain, &pinned) < 0) {
      return RecordSetupError(report);
    }
    report->toolchain_version = pinned.verified_version;
    report->toolchain_prefix = pinned.prefix;
    addIfNotPresent(policy.readonly_paths, pinned.prefix);
  }

  std::string cache_dir;
  if (!config.cache_root.empty()) {
    std::string fingerprint;
    if (ComputeCacheFingerprint(pinned.verified_version, config.lockfile,
                                &fingerprint) < 0 ||
        PrepareCacheDirectory(config.cache_root, fingerprint, target,
                              &cache_dir) < 0) {
      return RecordSetupError(report);
    }
    report->cache_dir = cache_dir;
    addIfNotPresent(policy.writable_paths, cache_dir);
  }

  ExecutionRequest build;
  build.command = config.build_command;
  build.working_dir = config.workspace;
  build.env = BuildSandboxEnvironment(config, pinned.bin_dir, cache_dir);
  build.timeout_secs = config.timeout_secs;
  build.kill_delay_secs = config.kill_delay_secs;
  build.output_limit = config.output_limit;

  ExecutionRequest test = build;
  test.command = config.test_command;

  if (ExecuteBuildAndTest(policy, target, build, test, report) < 0) {
    return -1;
  }

  if (config.commit) {
    if (report->state == RunState::TestsPassed) {
      const GitSandbox git = {&policy, &target, config.host_path};
      if (CommitWorkspace(config.workspace, config.identity,
                          config.commit_message, git, &report->commit) < 0) {
        // Recoverable, the classification stands.
        TbxClearError();
      }
    } else {
      PRINT_DEBUG("not committing, run ended in %s",
                  RunStateName(report->state));
    }
  }
  return 0;
}

int FinishRun(const HarnessConfig& config, const RunReport& report) {
  if (!config.quiet) {
    PrintSummary(report, stderr);
  }
  if (!config.report_path.empty() &&
      WriteJsonReport(report, config.report_path) < 0) {
    PRINT_INFO("could not write the report: %s", TbxGetErrorMsg());
  }
  int code = ExitCodeForReport(report);
  PRINT_DEBUG("exit code %d", code);
  return code;
}
