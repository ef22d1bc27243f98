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

/**
 * Runs one command in a restricted environment where it is subject to a few
 * rules:
 *
 *  - Only the read-only and writable roots of the policy, the workspace, a
 *    minimal /dev, a fresh /proc and an empty /tmp exist.
 *  - The command runs as the unprivileged target user with every capability
 *    outside the retained set dropped and no_new_privs set.
 *  - Without network access the command gets its own network namespace with
 *    only the loopback interface.
 *  - If the command takes longer than the timeout it is sent SIGTERM and,
 *    after the kill delay, the whole PID namespace is killed.
 *  - If the harness dies, the sandbox and everything in it die as well.
 */

#include "src/main/tools/sandbox.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/sandbox-pid1.h"

#include <errno.h>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>
#include <vector>

#define SANDBOX_TMP "/tmp"
#define FINAL_DRAIN_MS 2000

namespace {

// The empty directory the sandbox root is mounted on. All mounts live in the
// sandbox's mount namespace, so removing the directory is the whole teardown.
class SandboxRoot {
 public:
  SandboxRoot() {}
  ~SandboxRoot() {
    if (!path_.empty()) RemoveDirectoryTree(path_);
  }
  SandboxRoot(const SandboxRoot&) = delete;
  SandboxRoot& operator=(const SandboxRoot&) = delete;

  int Create() {
    path_ = CreateTempDirectory(SANDBOX_TMP, SANDBOX_ROOT_PREFIX);
    return path_.empty() ? UNRECOVERABLE_FAIL : 0;
  }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

struct Pipe {
  ScopedFd read;
  ScopedFd write;

  int Open() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
      return TbxReportSysError("pipe2");
    }
    read.reset(fds[0]);
    write.reset(fds[1]);
    return 0;
  }
};

}  // namespace


static int SetupError(const std::string& msg) {
  return TbxReportErrorAndMessage(msg, ErrorCode::SandboxSetupError);
}


static void BuildCommandLine(const ExecutionRequest& request, Pid1Args* args) {
  static const char kShell[] = "/bin/sh";
  static const char kDashC[] = "-c";
  args->argv = {const_cast<char*>(kShell), const_cast<char*>(kDashC),
                const_cast<char*>(request.command.c_str()), nullptr};
  args->envp.clear();
  for (const std::string& kv : request.env) {
    args->envp.push_back(const_cast<char*>(kv.c_str()));
  }
  args->envp.push_back(nullptr);
}


// Tells the child to go ahead, then waits for it to confirm that it armed
// PR_SET_PDEATHSIG while we were still alive.
static int HandshakeWithPid1(int* pipe_to_child, int* pipe_from_child) {
  if (SignalPipe(pipe_to_child) < 0) {
    return TbxReportSysError("signal sandbox");
  }
  if (WaitPipe(pipe_from_child) < 0) {
    return SetupError("sandbox died during startup");
  }
  PRINT_DEBUG("done manipulating pipes");
  return 0;
}


// Reads the outputs until `child` has exited and closed them or its time is
// up, then stops it by sending signals to `kill_target`: PID 1 of the
// sandbox, or the negated process group in best-effort mode.
static void SuperviseChild(pid_t kill_target, DrainChild* child,
                           const ExecutionRequest& request, int64_t start_ms,
                           int stdout_fd, int stderr_fd, OutputBuffer* out,
                           OutputBuffer* err, ExecutionResult* result) {
  std::vector<DrainTarget> targets = {{stdout_fd, out, false},
                                      {stderr_fd, err, false}};
  const int64_t deadline =
      request.timeout_secs > 0
          ? start_ms + static_cast<int64_t>(request.timeout_secs) * 1000
          : -1;

  DrainResult drained = DrainPipes(targets, child, deadline, true);
  if (drained == DRAIN_EOF) return;

  if (drained == DRAIN_DEADLINE || drained == DRAIN_CANCELLED) {
    PRINT_INFO("command %s after %d s, stopping it",
               drained == DRAIN_CANCELLED ? "cancelled" : "timed out",
               request.timeout_secs);
    result->timed_out = true;
  }

  if (request.kill_delay_secs > 0 && drained != DRAIN_ERROR) {
    kill(kill_target, SIGTERM);
    drained = DrainPipes(
        targets, child,
        MonotonicMillis() + static_cast<int64_t>(request.kill_delay_secs) * 1000,
        false);
    if (drained == DRAIN_EOF) return;
  }
  kill(kill_target, SIGKILL);
  // Bounded: a descendant that escaped the process group may hold the pipes.
  DrainPipes(targets, nullptr, MonotonicMillis() + FINAL_DRAIN_MS, false);
}


static void FillExitStatus(int status, ExecutionResult* result) {
  if (WIFSIGNALED(status)) {
    result->signal = WTERMSIG(status);
    result->exit_code = 128 + result->signal;
    PRINT_DEBUG("command exited due to signal %s", strsignal(result->signal));
  } else {
    result->signal = 0;
    result->exit_code = WEXITSTATUS(status);
    PRINT_DEBUG("command exited normally with code %d", result->exit_code);
  }
}


// Reads what the sandbox reported. Returns a negative value when setup
// failed, 1 when the command's wait status was received and 0 when nothing
// was reported.
static int ReadChildReports(int fd, int* wait_status) {
  ChildReport report;
  int res = 0;
  for (;;) {
    ssize_t n = read(fd, &report, sizeof(report));
    if (n < 0 && errno == EINTR) continue;
    if (n != static_cast<ssize_t>(sizeof(report))) break;
    if (report.kind == kSetupFailed) {
      report.msg[MAX_ERR_LEN - 1] = '\0';
      return TbxSetError(report.msg, static_cast<ErrorCode>(report.code));
    }
    if (report.kind == kChildExited) {
      *wait_status = report.wait_status;
      res = 1;
    }
  }
  return res;
}


static void CollectOutput(const OutputBuffer& out, const OutputBuffer& err,
                          int64_t start_ms, ExecutionResult* result) {
  result->stdout_output = out.Contents();
  result->stderr_output = err.Contents();
  result->stdout_truncated = out.truncated();
  result->stderr_truncated = err.truncated();
  result->duration_ms = MonotonicMillis() - start_ms;
}


static int LaunchInNamespaces(const SandboxPolicy& policy,
                              const TargetIdentity& target,
                              const ExecutionRequest& request,
                              ExecutionResult* result) {
  const bool caller_is_root = (geteuid() == 0);
  const int ns_flags = NamespaceCloneFlags(policy.network_enabled, caller_is_root);
  if (!CanCreateNamespaces(ns_flags)) {
    return SetupError("namespaces are not available: " + NamespaceSupportHint());
  }

  SandboxRoot root;
  if (root.Create() < 0) {
    return SetupError(std::string("sandbox root: ") + TbxGetErrorMsg());
  }

  Pipe out_pipe, err_pipe, report_pipe;
  if (out_pipe.Open() < 0 || err_pipe.Open() < 0 || report_pipe.Open() < 0) {
    return SetupError(std::string("pipes: ") + TbxGetErrorMsg());
  }
  int pipe_from_child[2], pipe_to_child[2];
  if (pipe2(pipe_from_child, O_CLOEXEC) < 0) {
    return SetupError(std::string("pipe2: ") + strerror(errno));
  }
  if (pipe2(pipe_to_child, O_CLOEXEC) < 0) {
    int saved_errno = errno;
    close(pipe_from_child[0]);
    close(pipe_from_child[1]);
    return SetupError(std::string("pipe2: ") + strerror(saved_errno));
  }

  Pid1Args args;
  args.policy = &policy;
  args.target = &target;
  args.request = &request;
  args.sandbox_root = root.path();
  args.outer_uid = getuid();
  args.outer_gid = getgid();
  args.user_namespace = (ns_flags & CLONE_NEWUSER) != 0;
  args.pipe_from_parent = pipe_to_child;
  args.pipe_to_parent = pipe_from_child;
  args.report_fd = report_pipe.write.get();
  args.stdout_fd = out_pipe.write.get();
  args.stderr_fd = err_pipe.write.get();
  BuildCommandLine(request, &args);

  const int kStackSize = 1024 * 1024;
  std::vector<char> child_stack(kStackSize);

  // We use clone instead of unshare, because unshare sometimes fails with
  // EINVAL due to a race condition in the Linux kernel (see
  // https://lkml.org/lkml/2015/7/28/833).
  PRINT_DEBUG("calling clone(2) with flags 0x%x...", ns_flags);
  const int64_t start = MonotonicMillis();
  const pid_t child_pid = clone(Pid1Main, child_stack.data() + kStackSize,
                                ns_flags | SIGCHLD, &args);
  if (child_pid < 0) {
    int saved_errno = errno;
    for (int fd : {pipe_from_child[0], pipe_from_child[1], pipe_to_child[0],
                   pipe_to_child[1]}) {
      close(fd);
    }
    return SetupError(std::string("clone: ") + strerror(saved_errno) + "; " +
                      NamespaceSupportHint());
  }
  PRINT_DEBUG("sandbox pid1 has PID %d", child_pid);

  // Only the sandbox writes to these.
  out_pipe.write.reset();
  err_pipe.write.reset();
  report_pipe.write.reset();

  if (HandshakeWithPid1(pipe_to_child, pipe_from_child) < 0) {
    KillAndWait(child_pid);
    int ignored = 0;
    if (ReadChildReports(report_pipe.read.get(), &ignored) < 0) {
      return UNRECOVERABLE_FAIL;
    }
    return SetupError("sandbox died during startup");
  }

  SetNonBlocking(out_pipe.read.get());
  SetNonBlocking(err_pipe.read.get());
  OutputBuffer out(request.output_limit), err(request.output_limit);
  DrainChild pid1 = {child_pid, 0, false};
  SuperviseChild(child_pid, &pid1, request, start, out_pipe.read.get(),
                 err_pipe.read.get(), &out, &err, result);

  if (WaitForChild(&pid1) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  const int pid1_status = pid1.status;
  CollectOutput(out, err, start, result);

  int wait_status = 0;
  const int reported = ReadChildReports(report_pipe.read.get(), &wait_status);
  if (reported < 0) {
    return reported;
  }
  if (reported == 1) {
    FillExitStatus(wait_status, result);
  } else if (result->timed_out) {
    // PID 1 was killed, which killed the command with it.
    FillExitStatus(pid1_status, result);
  } else {
    return SetupError("sandbox exited without reporting (status " +
                      std::to_string(pid1_status) + ")");
  }
  return 0;
}


// No namespaces: the command runs in its own process group with privileges
// dropped, on the host filesystem.
static int LaunchBestEffort(const SandboxPolicy& policy,
                            const TargetIdentity& target,
                            const ExecutionRequest& request,
                            ExecutionResult* result) {
  if (!policy.network_enabled) {
    return SetupError("best-effort isolation cannot disable network access");
  }
  PRINT_INFO("warning: best-effort isolation, the command sees the host "
             "filesystem and network");

  Pipe out_pipe, err_pipe, report_pipe;
  if (out_pipe.Open() < 0 || err_pipe.Open() < 0 || report_pipe.Open() < 0) {
    return SetupError(std::string("pipes: ") + TbxGetErrorMsg());
  }

  Pid1Args args;
  args.policy = &policy;
  args.target = &target;
  args.request = &request;
  args.outer_uid = getuid();
  args.outer_gid = getgid();
  args.user_namespace = false;
  args.pipe_from_parent = nullptr;
  args.pipe_to_parent = nullptr;
  args.report_fd = report_pipe.write.get();
  args.stdout_fd = out_pipe.write.get();
  args.stderr_fd = err_pipe.write.get();
  BuildCommandLine(request, &args);

  // A non-root harness has nothing to switch away from.
  const bool switch_identity = (geteuid() == 0);

  const int64_t start = MonotonicMillis();
  const pid_t child_pid = fork();
  if (child_pid < 0) {
    return SetupError(std::string("fork: ") + strerror(errno));
  }
  if (child_pid == 0) {
    if (setpgid(0, 0) < 0) {
      TbxReportSysError("setpgid");
      ReportChildFailure(args.report_fd, ErrorCode::SandboxSetupError);
    }
    ExecSandboxedCommand(args, switch_identity);
  }
  // Avoid racing the child's own setpgid before signalling the group.
  setpgid(child_pid, child_pid);

  out_pipe.write.reset();
  err_pipe.write.reset();
  report_pipe.write.reset();

  SetNonBlocking(out_pipe.read.get());
  SetNonBlocking(err_pipe.read.get());
  OutputBuffer out(request.output_limit), err(request.output_limit);
  DrainChild command = {child_pid, 0, false};
  SuperviseChild(-child_pid, &command, request, start, out_pipe.read.get(),
                 err_pipe.read.get(), &out, &err, result);

  if (WaitForChild(&command) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  CollectOutput(out, err, start, result);

  int ignored = 0;
  if (ReadChildReports(report_pipe.read.get(), &ignored) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  FillExitStatus(command.status, result);
  return 0;
}


int LaunchSandboxed(const SandboxPolicy& policy, const TargetIdentity& target,
                    const ExecutionRequest& request, ExecutionResult* result) {
  *result = ExecutionResult();
  if (request.working_dir.empty() || request.working_dir[0] != '/') {
    return TbxReportErrorAndMessage("working directory " + request.working_dir,
                                    ErrorCode::NotAnAbsolutePath);
  }
  PRINT_DEBUG("launching [%s] in %s (%s isolation, network %s)",
              request.command.c_str(), request.working_dir.c_str(),
              IsolationModeName(policy.isolation),
              policy.network_enabled ? "on" : "off");

  if (policy.isolation == ISOLATION_BEST_EFFORT) {
    return LaunchBestEffort(policy, target, request, result);
  }
  return LaunchInNamespaces(policy, target, request, result);
}
