/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/commit-agent.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#define GIT_HOME "/nonexistent"

const char* CommitStatusName(CommitStatus status) {
  switch (status) {
    case CommitStatus::NotAttempted: return "not_attempted";
    case CommitStatus::NoChanges: return "no_changes";
    case CommitStatus::Committed: return "committed";
    case CommitStatus::Failed: return "failed";
  }
  return "unknown";
}


std::vector<std::string> GitEnvironment(const AutomationIdentity& identity,
                                        const std::string& path) {
  return {
      "PATH=" + (path.empty() ? std::string("/usr/bin:/bin") : path),
      "HOME=" GIT_HOME,
      "XDG_CONFIG_HOME=" GIT_HOME,
      "LC_ALL=C",
      "GIT_CONFIG_NOSYSTEM=1",
      "GIT_CONFIG_GLOBAL=/dev/null",
      "GIT_TERMINAL_PROMPT=0",
      "GIT_AUTHOR_NAME=" + identity.author_name,
      "GIT_AUTHOR_EMAIL=" + identity.author_email,
      "GIT_COMMITTER_NAME=" + identity.committer_name,
      "GIT_COMMITTER_EMAIL=" + identity.committer_email,
  };
}


static std::string GitCommandLine(const AutomationIdentity& identity,
                                  const std::string& workspace,
                                  const std::vector<std::string>& args) {
  std::vector<std::string> argv = {
      "git",
      "-c", "user.name=" + identity.committer_name,
      "-c", "user.email=" + identity.committer_email,
      "-c", "commit.gpgsign=false",
      "-c", "core.hooksPath=/dev/null",
      "-C", workspace,
  };
  argv.insert(argv.end(), args.begin(), args.end());
  std::string line = "exec";
  for (const std::string& a : argv) line += " " + ShellQuote(a);
  return line;
}


static int RunGit(const std::string& workspace,
                  const AutomationIdentity& identity,
                  const GitSandbox& sandbox,
                  const std::vector<std::string>& args, std::string* output) {
  const std::string what = "git " + args.front();
  ExecutionRequest request;
  request.command = GitCommandLine(identity, workspace, args);
  request.working_dir = workspace;
  request.env = GitEnvironment(identity, sandbox.path);
  request.timeout_secs = GIT_COMMAND_TIMEOUT_SECS;

  ExecutionResult res;
  if (LaunchSandboxed(*sandbox.policy, *sandbox.target, request, &res) < 0) {
    return TbxReportErrorAndMessage(what + ": " + TbxGetErrorMsg(),
                                    ErrorCode::CommitFailed);
  }
  if (res.timed_out || res.exit_code != 0) {
    return TbxReportErrorAndMessage(
        what + " exited with " + std::to_string(res.exit_code) + ": " +
            Trim(res.stderr_output + res.stdout_output),
        ErrorCode::CommitFailed);
  }
  *output = res.stdout_output;
  return 0;
}


int HasUncommittedChanges(const std::string& workspace,
                          const AutomationIdentity& identity,
                          const GitSandbox& sandbox, bool* dirty) {
  std::string output;
  int rc = RunGit(workspace, identity, sandbox,
                  {"status", "--porcelain", "--untracked-files=all"}, &output);
  if (rc < 0) return rc;
  *dirty = !Trim(output).empty();
  return 0;
}


int CommitWorkspace(const std::string& workspace,
                    const AutomationIdentity& identity,
                    const std::string& message, const GitSandbox& sandbox,
                    CommitReport* report) {
  *report = CommitReport();

  bool dirty = false;
  std::string output;
  int rc = HasUncommittedChanges(workspace, identity, sandbox, &dirty);
  if (rc == 0 && !dirty) {
    PRINT_INFO("workspace clean, nothing to commit");
    report->status = CommitStatus::NoChanges;
    return 0;
  }
  if (rc == 0) {
    rc = RunGit(workspace, identity, sandbox, {"add", "-A"}, &output);
  }
  if (rc == 0) {
    rc = RunGit(workspace, identity, sandbox,
                {"commit", "--no-verify", "--no-gpg-sign", "-q", "-m",
                 message.empty() ? DEFAULT_COMMIT_MESSAGE : message},
                &output);
  }
  if (rc == 0) {
    rc = RunGit(workspace, identity, sandbox, {"rev-parse", "HEAD"}, &output);
  }
  if (rc < 0) {
    report->status = CommitStatus::Failed;
    report->error = TbxGetErrorMsg();
    PRINT_INFO("commit failed: %s", report->error.c_str());
    return rc;
  }

  report->status = CommitStatus::Committed;
  report->commit_id = Trim(output);
  PRINT_INFO("committed %s as %s <%s>", report->commit_id.c_str(),
             identity.author_name.c_str(), identity.author_email.c_str());
  return 0;
}
