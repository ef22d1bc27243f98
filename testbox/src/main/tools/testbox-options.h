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

#ifndef SRC_MAIN_TOOLS_TESTBOX_OPTIONS_H_
#define SRC_MAIN_TOOLS_TESTBOX_OPTIONS_H_

#include <stdbool.h>
#include <stddef.h>

#include <map>
#include <string>
#include <vector>

#include "src/main/tools/commit-agent.h"
#include "src/main/tools/sandbox.h"
#include "src/main/tools/toolchain-pinner.h"

#define DEFAULT_SANDBOX_PATH "/usr/local/bin:/usr/bin:/bin"

// Everything a run needs, read once at startup from the environment and the
// command line, validated, and then only read.
struct HarnessConfig {
  // Working directory of both steps, mounted read-write (-W)
  std::string workspace;
  // Build step, optional (-B)
  std::string build_command;
  // Test step (-X or the arguments after --)
  std::string test_command;
  // Per-step timeout, 0 for none (-T)
  int timeout_secs = 0;
  // Grace period between SIGTERM and SIGKILL on timeout (-t)
  int kill_delay_secs = 0;
  // Captured bytes kept per stream (-o)
  size_t output_limit = DEFAULT_OUTPUT_LIMIT;
  // A toolchain was pinned (-k)
  bool have_toolchain = false;
  ToolchainSpec toolchain;
  SandboxPolicy policy;
  // Variable names copied from the harness environment (-e)
  std::vector<std::string> env_passthrough;
  // KEY=VALUE pairs the commands get, passthrough and -E resolved
  std::vector<std::string> env;
  AutomationIdentity identity;
  // Commit workspace changes after a passing run (-c)
  bool commit = false;
  std::string commit_message = DEFAULT_COMMIT_MESSAGE;
  // Dependency cache (-K/-L)
  std::string cache_root;
  std::string lockfile;
  // Debug log (-D)
  std::string debug_path;
  // JSON report (-j)
  std::string report_path;
  // No progress messages on stderr (-q)
  bool quiet = false;
  // PATH of the harness; git runs with it inside the sandbox
  std::string host_path;
};

typedef std::map<std::string, std::string> EnvMap;

EnvMap EnvironmentToMap(char** envp);

// Applies the TESTBOX_* variables of `env` to `config`.
int LoadEnvironment(const EnvMap& env, HarnessConfig* config);

// Environment first, then the command line (with @FILE expansion) on top,
// then validation. Prints usage and returns a negative value on bad input.
int ParseOptions(int argc, char* argv[], char** envp, HarnessConfig* config);

// Fills defaults and checks paths, toolchain and limits.
int ValidateConfig(const EnvMap& env, HarnessConfig* config);

int ValidateReadWritePaths(const std::vector<std::string>& readables,
                           const std::vector<std::string>& writables);

#endif  // SRC_MAIN_TOOLS_TESTBOX_OPTIONS_H_
