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

#ifndef SRC_MAIN_TOOLS_SANDBOX_PID1_H_
#define SRC_MAIN_TOOLS_SANDBOX_PID1_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/sandbox.h"

enum ChildReportKind {
  // Building the sandbox or dropping privileges failed; nothing was run.
  kSetupFailed = 1,
  // The command ran; wait_status is its waitpid() status.
  kChildExited = 2
};

// Sent from the sandbox to the harness over the report pipe. Smaller than
// PIPE_BUF, so a single write is atomic.
struct ChildReport {
  int kind;
  int code;
  int sys_errno;
  int wait_status;
  char msg[MAX_ERR_LEN];
};

struct Pid1Args {
  const SandboxPolicy* policy;
  const TargetIdentity* target;
  const ExecutionRequest* request;
  // Empty directory the new root is assembled on.
  std::string sandbox_root;
  uid_t outer_uid;
  gid_t outer_gid;
  // A user namespace was created, so the identity comes from the mapping.
  bool user_namespace;
  int* pipe_from_parent;
  int* pipe_to_parent;
  int report_fd;
  int stdout_fd;
  int stderr_fd;
  // Prepared before clone/fork; NULL-terminated.
  std::vector<char*> argv;
  std::vector<char*> envp;
};

// Entry point of PID 1 of the sandbox's PID namespace.
int Pid1Main(void* args);

// Final steps shared by both isolation modes: redirect output, apply resource
// limits, drop privileges, enter the working directory and execve the command.
// Never returns; failures are sent over the report pipe.
[[noreturn]] void ExecSandboxedCommand(const Pid1Args& args,
                                       bool switch_identity);

void SendChildReport(int fd, const ChildReport& report);

// Sends the last recorded error as a kSetupFailed report tagged with `code`
// and exits.
[[noreturn]] void ReportChildFailure(int fd, ErrorCode code);

#endif  // SRC_MAIN_TOOLS_SANDBOX_PID1_H_
