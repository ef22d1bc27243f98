/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_COMMIT_AGENT_H_
#define SRC_MAIN_TOOLS_COMMIT_AGENT_H_

#include <string>
#include <vector>

#include "src/main/tools/privilege-dropper.h"
#include "src/main/tools/sandbox.h"

#define DEFAULT_AUTOMATION_NAME "testbox-bot"
#define DEFAULT_AUTOMATION_EMAIL "testbox-bot@localhost"
#define DEFAULT_COMMIT_MESSAGE "Apply changes from automated test run"
#define GIT_COMMAND_TIMEOUT_SECS 300

// Who automated commits are attributed to. Filled from TESTBOX_* settings
// only, never from GIT_*, USER or the invoker's git configuration.
struct AutomationIdentity {
  std::string author_name = DEFAULT_AUTOMATION_NAME;
  std::string author_email = DEFAULT_AUTOMATION_EMAIL;
  std::string committer_name = DEFAULT_AUTOMATION_NAME;
  std::string committer_email = DEFAULT_AUTOMATION_EMAIL;
};

enum class CommitStatus { NotAttempted, NoChanges, Committed, Failed };

const char* CommitStatusName(CommitStatus status);

struct CommitReport {
  CommitStatus status = CommitStatus::NotAttempted;
  std::string commit_id;
  std::string error;
};

// Environment git runs with: `path`, a HOME away from the invoker, no system
// or global config and the identity in GIT_AUTHOR_* and GIT_COMMITTER_*.
std::vector<std::string> GitEnvironment(const AutomationIdentity& identity,
                                        const std::string& path);

// Git reads the workspace's .git/config and .gitattributes, which the tests
// could rewrite, so every git command runs under `policy` as `target` like
// the tests themselves.
struct GitSandbox {
  const SandboxPolicy* policy;
  const TargetIdentity* target;
  // PATH git is looked up in inside the sandbox.
  std::string path;
};

int HasUncommittedChanges(const std::string& workspace,
                          const AutomationIdentity& identity,
                          const GitSandbox& sandbox, bool* dirty);

// Stages everything in `workspace` and commits it as `identity` when there is
// anything to commit. Git failures give CommitFailed, which is recoverable
// and leaves `report` with status Failed.
int CommitWorkspace(const std::string& workspace,
                    const AutomationIdentity& identity,
                    const std::string& message, const GitSandbox& sandbox,
                    CommitReport* report);

#endif  // SRC_MAIN_TOOLS_COMMIT_AGENT_H_
