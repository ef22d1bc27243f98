// Copyright 2016 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_SANDBOX_H_
#define SRC_MAIN_TOOLS_SANDBOX_H_

#include <stdint.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "src/main/tools/isolation-support.h"
#include "src/main/tools/output-buffer.h"
#include "src/main/tools/privilege-dropper.h"

#define SANDBOX_HOSTNAME "localhost"
#define SANDBOX_DOMAINNAME "localdomain"
#define SANDBOX_ROOT_PREFIX "testbox-root-"

struct ResourceLimits {
  // RLIMIT_NOFILE, -1 keeps the inherited limit.
  long max_open_files = 1024;
  // RLIMIT_FSIZE in bytes, -1 keeps the inherited limit.
  long max_file_size = -1;
  // RLIMIT_CORE = 0.
  bool disable_core_dumps = true;
};

// What a sandboxed command may see and do. Built once per run.
struct SandboxPolicy {
  // Host paths visible read-only at the same location inside the sandbox.
  std::vector<std::string> readonly_paths;
  // Host paths visible read-write at the same location.
  std::vector<std::string> writable_paths;
  bool network_enabled = false;
  // CAP_BIT() mask of capabilities the command keeps. Everything else goes.
  uint64_t retained_capabilities = 0;
  std::string user = "nobody";
  std::string group;
  IsolationMode isolation = ISOLATION_NAMESPACES;
  // Set hostname/domainname to SANDBOX_HOSTNAME/SANDBOX_DOMAINNAME.
  bool fake_hostname = true;
  ResourceLimits limits;
};

struct ExecutionRequest {
  // Run through /bin/sh -c.
  std::string command;
  // Absolute; mounted read-write and used as the cwd.
  std::string working_dir;
  // KEY=VALUE; the command sees nothing else.
  std::vector<std::string> env;
  // 0 disables the timeout.
  int timeout_secs = 0;
  // Grace period between SIGTERM and SIGKILL once the timeout expired.
  int kill_delay_secs = 0;
  size_t output_limit = DEFAULT_OUTPUT_LIMIT;
};

struct ExecutionResult {
  int exit_code = -1;
  int signal = 0;
  bool timed_out = false;
  std::string stdout_output;
  std::string stderr_output;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  int64_t duration_ms = 0;
};

// Runs `request` under `policy` as `target`. Returns 0 whenever the command
// was started and waited for, whatever its outcome, which is left in
// `result`. Returns a negative value with SandboxSetupError or
// PrivilegeDropFailed recorded when the sandbox could not be built; the
// command has then not run.
int LaunchSandboxed(const SandboxPolicy& policy, const TargetIdentity& target,
                    const ExecutionRequest& request, ExecutionResult* result);

#endif  // SRC_MAIN_TOOLS_SANDBOX_H_
