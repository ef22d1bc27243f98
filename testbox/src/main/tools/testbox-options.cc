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

#include "src/main/tools/testbox-options.h"

#include <errno.h>
#include <getopt.h>
#include <limits.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <deque>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

using std::ifstream;
using std::unique_ptr;
using std::vector;

static const char* const kDefaultReadonlyPaths[] = {"/bin", "/usr", "/lib",
                                                    "/lib64", "/etc", "/sbin"};

// Roots the sandbox builds itself and that cannot be handed in.
static const char* const kReservedPaths[] = {"/", "/proc", "/dev"};

// Print out a usage error and return it. fmt is a format string for the error
// message to print.
static int Usage(const char* program_name, const char* fmt, ...) {
  char msg[MAX_ERR_LEN];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  fprintf(stderr, "%s\n", msg);
  fprintf(stderr, "\nUsage: %s [options] [-- test command]\n", program_name);
  fprintf(
      stderr,
      "\nPossible arguments:\n"
      "  -W <dir>  workspace, mounted read-write (default: current "
      "directory)\n"
      "  -B <cmd>  build command, run before the tests\n"
      "  -X <cmd>  test command (or give it after --)\n"
      "  -T <secs>  timeout of each command, 0 for none\n"
      "  -t <secs>  on timeout, how long to wait after SIGTERM before "
      "SIGKILL\n"
      "  -r <path>  make a host path visible read-only\n"
      "  -w <path>  make a host path visible read-write\n"
      "  -n  disable the network (default)\n"
      "  -N  enable the network\n"
      "        Only one of -n and -N may be specified.\n"
      "  -u <user>  unprivileged user the commands run as (default: "
      "nobody)\n"
      "  -g <group>  unprivileged group (default: the user's)\n"
      "  -k <name@version>  pin a toolchain at an exact version\n"
      "  -s <source>  toolchain installation source\n"
      "  -p <dir>  toolchain install root\n"
      "  -I <cmd>  toolchain install command template\n"
      "  -V <cmd>  toolchain version query template\n"
      "  -e <NAME>  copy an environment variable into the sandbox\n"
      "  -E <KEY=VALUE>  set a variable inside the sandbox\n"
      "  -o <bytes>  captured output kept per stream\n"
      "  -c  commit workspace changes after a passing run\n"
      "  -m <msg>  commit message\n"
      "  -K <dir>  dependency cache root\n"
      "  -L <file>  lockfile the cache is keyed on\n"
      "  -x  best-effort isolation for hosts without namespaces\n"
      "  -D <file>  write debug info to this file\n"
      "  -j <file>  write the JSON report to this file\n"
      "  -q  no progress messages\n"
      "  @FILE  read newline-separated arguments from FILE\n"
      "  --  test command, followed by arguments\n");
  return TbxReportErrorAndMessage(msg, ErrorCode::IllegalConfiguration);
}

static int ParseSeconds(const char* value, int* out) {
  char* end = nullptr;
  errno = 0;
  long v = strtol(value, &end, 10);
  if (errno != 0 || end == value || *end != '\0' || v < 0 || v > INT_MAX) {
    return -1;
  }
  *out = static_cast<int>(v);
  return 0;
}

static int ParseSize(const char* value, size_t* out) {
  char* end = nullptr;
  errno = 0;
  unsigned long long v = strtoull(value, &end, 10);
  if (errno != 0 || end == value || *end != '\0' || value[0] == '-' ||
      v == 0) {
    return -1;
  }
  *out = static_cast<size_t>(v);
  return 0;
}

static int ParseFlag(const std::string& value, bool* out) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    *out = true;
    return 0;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off" ||
      value.empty()) {
    *out = false;
    return 0;
  }
  return -1;
}

// Splits name@version at the last '@'.
static int ParseToolchainPin(const std::string& pin, ToolchainSpec* spec) {
  size_t at = pin.rfind('@');
  if (at == std::string::npos || at == 0 || at + 1 == pin.size()) {
    return -1;
  }
  spec->name = pin.substr(0, at);
  spec->version = pin.substr(at + 1);
  return 0;
}

EnvMap EnvironmentToMap(char** envp) {
  EnvMap env;
  if (envp == nullptr) {
    return env;
  }
  for (char** e = envp; *e != nullptr; ++e) {
    const char* eq = strchr(*e, '=');
    if (eq == nullptr) {
      continue;
    }
    env[std::string(*e, eq - *e)] = std::string(eq + 1);
  }
  return env;
}

static bool Lookup(const EnvMap& env, const char* name, std::string* value) {
  auto it = env.find(name);
  if (it == env.end()) {
    return false;
  }
  *value = it->second;
  return true;
}

int LoadEnvironment(const EnvMap& env, HarnessConfig* config) {
  std::string v;

  Lookup(env, "TESTBOX_WORKSPACE", &config->workspace);
  Lookup(env, "TESTBOX_BUILD_CMD", &config->build_command);
  Lookup(env, "TESTBOX_TEST_CMD", &config->test_command);

  if (Lookup(env, "TESTBOX_TIMEOUT", &v) &&
      ParseSeconds(v.c_str(), &config->timeout_secs) < 0) {
    return TbxReportErrorAndMessage("TESTBOX_TIMEOUT must be a number of seconds",
                                    ErrorCode::IllegalConfiguration);
  }
  if (Lookup(env, "TESTBOX_KILL_DELAY", &v) &&
      ParseSeconds(v.c_str(), &config->kill_delay_secs) < 0) {
    return TbxReportErrorAndMessage(
        "TESTBOX_KILL_DELAY must be a number of seconds",
        ErrorCode::IllegalConfiguration);
  }
  if (Lookup(env, "TESTBOX_OUTPUT_LIMIT", &v) &&
      ParseSize(v.c_str(), &config->output_limit) < 0) {
    return TbxReportErrorAndMessage(
        "TESTBOX_OUTPUT_LIMIT must be a positive number of bytes",
        ErrorCode::IllegalConfiguration);
  }

  if (Lookup(env, "TESTBOX_READONLY_PATHS", &v)) {
    for (const auto& p : SplitString(v, ':'))
      addIfNotPresent(config->policy.readonly_paths, p);
  }
  if (Lookup(env, "TESTBOX_WRITABLE_PATHS", &v)) {
    for (const auto& p : SplitString(v, ':'))
      addIfNotPresent(config->policy.writable_paths, p);
  }

  if (Lookup(env, "TESTBOX_NETWORK", &v) &&
      ParseFlag(v, &config->policy.network_enabled) < 0) {
    return TbxReportErrorAndMessage("TESTBOX_NETWORK must be on or off",
                                    ErrorCode::IllegalConfiguration);
  }

  Lookup(env, "TESTBOX_USER", &config->policy.user);
  Lookup(env, "TESTBOX_GROUP", &config->policy.group);

  bool have_name = Lookup(env, "TESTBOX_TOOLCHAIN_NAME", &config->toolchain.name);
  bool have_version =
      Lookup(env, "TESTBOX_TOOLCHAIN_VERSION", &config->toolchain.version);
  if (have_name != have_version) {
    return TbxReportErrorAndMessage(
        "TESTBOX_TOOLCHAIN_NAME and TESTBOX_TOOLCHAIN_VERSION go together",
        ErrorCode::InvalidToolchainSpec);
  }
  config->have_toolchain = have_name;
  Lookup(env, "TESTBOX_TOOLCHAIN_SOURCE", &config->toolchain.source);
  Lookup(env, "TESTBOX_TOOLCHAIN_ROOT", &config->toolchain.root);
  Lookup(env, "TESTBOX_TOOLCHAIN_INSTALL_CMD",
         &config->toolchain.install_command);
  Lookup(env, "TESTBOX_TOOLCHAIN_VERSION_CMD",
         &config->toolchain.version_command);

  if (Lookup(env, "TESTBOX_ENV_PASSTHROUGH", &v)) {
    for (const auto& name : SplitString(v, ','))
      addIfNotPresent(config->env_passthrough, Trim(name));
  }

  if (Lookup(env, "TESTBOX_COMMIT", &v) && ParseFlag(v, &config->commit) < 0) {
    return TbxReportErrorAndMessage("TESTBOX_COMMIT must be 0 or 1",
                                    ErrorCode::IllegalConfiguration);
  }
  Lookup(env, "TESTBOX_COMMIT_MESSAGE", &config->commit_message);
  Lookup(env, "TESTBOX_AUTHOR_NAME", &config->identity.author_name);
  Lookup(env, "TESTBOX_AUTHOR_EMAIL", &config->identity.author_email);
  Lookup(env, "TESTBOX_COMMITTER_NAME", &config->identity.committer_name);
  Lookup(env, "TESTBOX_COMMITTER_EMAIL", &config->identity.committer_email);

  Lookup(env, "TESTBOX_CACHE_ROOT", &config->cache_root);
  Lookup(env, "TESTBOX_LOCKFILE", &config->lockfile);

  if (Lookup(env, "TESTBOX_ISOLATION", &v)) {
    if (v == "namespaces") {
      config->policy.isolation = ISOLATION_NAMESPACES;
    } else if (v == "best-effort") {
      config->policy.isolation = ISOLATION_BEST_EFFORT;
    } else {
      return TbxReportErrorAndMessage(
          "TESTBOX_ISOLATION must be namespaces or best-effort",
          ErrorCode::IllegalConfiguration);
    }
  }

  Lookup(env, "TESTBOX_DEBUG_LOG", &config->debug_path);
  Lookup(env, "TESTBOX_REPORT", &config->report_path);
  if (Lookup(env, "TESTBOX_QUIET", &v) && ParseFlag(v, &config->quiet) < 0) {
    return TbxReportErrorAndMessage("TESTBOX_QUIET must be 0 or 1",
                                    ErrorCode::IllegalConfiguration);
  }

  Lookup(env, "PATH", &config->host_path);
  return 0;
}

// Parses the given command line into `config`. Every flag overrides what the
// environment set.
static int ParseCommandLine(unique_ptr<vector<char*>> args,
                            HarnessConfig* config) {
  const char* program_name = args->front();
  bool network_flag_seen = false;
  bool readonly_from_flags = false;
  bool writable_from_flags = false;
  bool passthrough_from_flags = false;
  int c;

  // Full reinitialisation, ParseOptions may run more than once per process.
  optind = 0;
  opterr = 1;
  while ((c = getopt(static_cast<int>(args->size()), args->data(),
                     "+:W:B:X:T:t:r:w:nNu:g:k:s:p:I:V:e:E:o:cm:K:L:xD:j:q")) !=
         -1) {
    switch (c) {
      case 'W':
        config->workspace = optarg;
        break;
      case 'B':
        config->build_command = optarg;
        break;
      case 'X':
        config->test_command = optarg;
        break;
      case 'T':
        if (ParseSeconds(optarg, &config->timeout_secs) < 0) {
          return Usage(program_name, "Invalid timeout (-T) value: %s", optarg);
        }
        break;
      case 't':
        if (ParseSeconds(optarg, &config->kill_delay_secs) < 0) {
          return Usage(program_name, "Invalid kill delay (-t) value: %s",
                       optarg);
        }
        break;
      case 'r':
        if (!readonly_from_flags) {
          config->policy.readonly_paths.clear();
          readonly_from_flags = true;
        }
        addIfNotPresent(config->policy.readonly_paths, optarg);
        break;
      case 'w':
        if (!writable_from_flags) {
          config->policy.writable_paths.clear();
          writable_from_flags = true;
        }
        addIfNotPresent(config->policy.writable_paths, optarg);
        break;
      case 'n':
      case 'N':
        if (network_flag_seen) {
          return Usage(program_name,
                       "Only one of -n and -N may be specified.");
        }
        network_flag_seen = true;
        config->policy.network_enabled = (c == 'N');
        break;
      case 'u':
        config->policy.user = optarg;
        break;
      case 'g':
        config->policy.group = optarg;
        break;
      case 'k':
        if (ParseToolchainPin(optarg, &config->toolchain) < 0) {
          return Usage(program_name,
                       "The -k option expects name@version, got: %s", optarg);
        }
        config->have_toolchain = true;
        break;
      case 's':
        config->toolchain.source = optarg;
        break;
      case 'p':
        config->toolchain.root = optarg;
        break;
      case 'I':
        config->toolchain.install_command = optarg;
        break;
      case 'V':
        config->toolchain.version_command = optarg;
        break;
      case 'e':
        if (!passthrough_from_flags) {
          config->env_passthrough.clear();
          passthrough_from_flags = true;
        }
        addIfNotPresent(config->env_passthrough, optarg);
        break;
      case 'E':
        if (strchr(optarg, '=') == nullptr || optarg[0] == '=') {
          return Usage(program_name, "The -E option expects KEY=VALUE, got: %s",
                       optarg);
        }
        config->env.push_back(optarg);
        break;
      case 'o':
        if (ParseSize(optarg, &config->output_limit) < 0) {
          return Usage(program_name, "Invalid output limit (-o) value: %s",
                       optarg);
        }
        break;
      case 'c':
        config->commit = true;
        break;
      case 'm':
        config->commit_message = optarg;
        break;
      case 'K':
        config->cache_root = optarg;
        break;
      case 'L':
        config->lockfile = optarg;
        break;
      case 'x':
        config->policy.isolation = ISOLATION_BEST_EFFORT;
        break;
      case 'D':
        if (!config->debug_path.empty() &&
            config->debug_path != std::string(optarg)) {
          return Usage(program_name,
                       "Cannot write debug output to more than one file.");
        }
        config->debug_path = optarg;
        break;
      case 'j':
        config->report_path = optarg;
        break;
      case 'q':
        config->quiet = true;
        break;
      case ':':
        return Usage(program_name, "Option -%c requires an argument.",
                     optopt);
      case '?':
      default:
        return Usage(program_name, "Unrecognized argument: -%c (%d)", optopt,
                     optind);
    }
  }

  if (optind < static_cast<int>(args->size())) {
    if (!config->test_command.empty()) {
      return Usage(program_name,
                   "Give the test command either with -X or after --, not "
                   "both.");
    }
    // Each word is quoted so that /bin/sh -c sees the caller's argv.
    std::string command;
    for (size_t i = optind; i < args->size(); ++i) {
      if (!command.empty()) command += ' ';
      command += ShellQuote((*args)[i]);
    }
    config->test_command = command;
  }
  return 0;
}

// Expands a single argument, expanding options @filename to read in the
// content of the file and add it to the list of processed arguments. Lines
// are kept alive in `storage`.
static int ExpandArgument(vector<char*>* expanded, char* arg,
                          std::deque<std::string>* storage, int depth) {
  if (arg[0] != '@') {
    expanded->push_back(arg);
    return 0;
  }
  const char* filename = arg + 1;  // strip off the '@'.
  if (depth > MAX_DEPTH_REMOVE_TREE) {
    return TbxReportErrorAndMessage(
        std::string("argument files nested too deeply at ") + filename,
        ErrorCode::IllegalConfiguration);
  }
  ifstream f(filename);
  if (!f.is_open()) {
    return TbxReportErrorAndMessage(
        std::string("opening argument file ") + filename + " failed",
        ErrorCode::PathDoesNotExist);
  }

  for (std::string line; std::getline(f, line);) {
    if (line.empty()) {
      continue;
    }
    storage->push_back(line);
    if (ExpandArgument(expanded, &storage->back()[0], storage, depth + 1) < 0) {
      return -1;
    }
  }

  if (f.bad()) {
    return TbxReportErrorAndMessage(
        std::string("error while reading from argument file ") + filename,
        ErrorCode::GeneralOSError);
  }
  return 0;
}

// Pre-processes an argument list, expanding options @filename to read in the
// content of the file and add it to the list of arguments. Stops expanding
// arguments once it encounters "--".
static unique_ptr<vector<char*>> ExpandArguments(
    const vector<char*>& args, std::deque<std::string>* storage) {
  unique_ptr<vector<char*>> expanded(new vector<char*>());
  expanded->reserve(args.size());
  for (auto arg = args.begin(); arg != args.end(); ++arg) {
    if (strcmp(*arg, "--") != 0) {
      if (ExpandArgument(expanded.get(), *arg, storage, 0) < 0) {
        return nullptr;
      }
    } else {
      expanded->insert(expanded->end(), arg, args.end());
      break;
    }
  }
  return expanded;
}

static int ValidatePath(const std::string& path) {
  if (path.empty() || path[0] != '/') {
    return TbxReportErrorAndMessage(path, ErrorCode::NotAnAbsolutePath);
  }
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return TbxReportErrorAndMessage(path, ErrorCode::PathDoesNotExist);
  }
  std::string normal = fs::path(path).lexically_normal().string();
  if (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  for (const char* reserved : kReservedPaths) {
    if (normal == reserved) {
      return TbxReportErrorAndMessage(
          path + " cannot be mounted into the sandbox",
          ErrorCode::IllegalConfiguration);
    }
  }
  return 0;
}

int ValidateReadWritePaths(const std::vector<std::string>& readables,
                           const std::vector<std::string>& writables) {
  for (const auto& readable_path : readables) {
    for (const auto& writable_path : writables) {
      if (fs::path(readable_path).lexically_normal() ==
          fs::path(writable_path).lexically_normal()) {
        return TbxReportErrorAndMessage(readable_path,
                                        ErrorCode::FileReadAndWrite);
      }
    }
  }
  return 0;
}

// Resolves the passthrough names against the harness environment. Unset
// names are skipped. Explicit -E values win over passed-through ones.
static void ResolveSandboxEnvironment(const EnvMap& env,
                                      HarnessConfig* config) {
  std::vector<std::string> resolved;
  for (const auto& name : config->env_passthrough) {
    if (name.empty()) continue;
    bool overridden = false;
    for (const auto& kv : config->env) {
      if (kv.compare(0, name.size() + 1, name + "=") == 0) {
        overridden = true;
        break;
      }
    }
    auto it = env.find(name);
    if (overridden || it == env.end()) {
      if (!overridden) PRINT_DEBUG("passthrough variable %s is not set", name.c_str());
      continue;
    }
    resolved.push_back(name + "=" + it->second);
  }
  resolved.insert(resolved.end(), config->env.begin(), config->env.end());
  config->env.swap(resolved);
}

int ValidateConfig(const EnvMap& env, HarnessConfig* config) {
  if (config->workspace.empty()) {
    if (GetCWD(config->workspace) < 0) {
      return TbxReportErrorAndMessage("Could not obtain CWD",
                                      ErrorCode::GeneralOSError);
    }
  }
  if (config->workspace[0] != '/') {
    return TbxReportErrorAndMessage(config->workspace,
                                    ErrorCode::NotAnAbsolutePath);
  }
  std::error_code ec;
  if (!fs::is_directory(config->workspace, ec)) {
    return TbxReportErrorAndMessage(config->workspace,
                                    ErrorCode::PathDoesNotExist);
  }
  fs::path canonical = fs::canonical(config->workspace, ec);
  if (ec) {
    return TbxReportErrorAndMessage(config->workspace + ": " + ec.message(),
                                    ErrorCode::GeneralOSError);
  }
  config->workspace = canonical.string();
  if (config->workspace == "/") {
    return TbxReportErrorAndMessage("the workspace cannot be /",
                                    ErrorCode::IllegalConfiguration);
  }

  if (Trim(config->test_command).empty()) {
    return TbxReportErrorAndMessage("No test command specified",
                                    ErrorCode::IllegalConfiguration);
  }

  if (config->policy.readonly_paths.empty()) {
    for (const char* path : kDefaultReadonlyPaths) {
      if (fs::exists(path, ec)) {
        config->policy.readonly_paths.push_back(path);
      }
    }
  }
  for (const auto& path : config->policy.readonly_paths) {
    if (ValidatePath(path) < 0) return -1;
  }
  for (const auto& path : config->policy.writable_paths) {
    if (ValidatePath(path) < 0) return -1;
  }
  if (ValidateReadWritePaths(config->policy.readonly_paths,
                             config->policy.writable_paths) < 0) {
    return -1;
  }
  if (ValidateReadWritePaths(config->policy.readonly_paths,
                             {config->workspace}) < 0) {
    return -1;
  }

  if (config->policy.user.empty()) {
    return TbxReportErrorAndMessage("the unprivileged user cannot be empty",
                                    ErrorCode::IllegalConfiguration);
  }

  if (config->have_toolchain) {
    if (config->toolchain.name.empty() ||
        config->toolchain.name.find('/') != std::string::npos ||
        config->toolchain.name == "." || config->toolchain.name == "..") {
      return TbxReportErrorAndMessage(
          "invalid toolchain name " + config->toolchain.name,
          ErrorCode::InvalidToolchainSpec);
    }
    if (!IsExactVersion(config->toolchain.version)) {
      return TbxReportErrorAndMessage(
          config->toolchain.name + "@" + config->toolchain.version,
          ErrorCode::InvalidToolchainSpec);
    }
    if (config->toolchain.root.empty() || config->toolchain.root[0] != '/') {
      return TbxReportErrorAndMessage(config->toolchain.root,
                                      ErrorCode::NotAnAbsolutePath);
    }
    if (config->toolchain.version_command.empty()) {
      return TbxReportErrorAndMessage("empty toolchain version command",
                                      ErrorCode::InvalidToolchainSpec);
    }
  }

  if (!config->cache_root.empty() && config->cache_root[0] != '/') {
    return TbxReportErrorAndMessage(config->cache_root,
                                    ErrorCode::NotAnAbsolutePath);
  }
  if (!config->lockfile.empty()) {
    if (config->lockfile[0] != '/') {
      config->lockfile =
          (fs::path(config->workspace) / config->lockfile).string();
    }
    if (config->cache_root.empty()) {
      return TbxReportErrorAndMessage("a lockfile needs a cache root (-K)",
                                      ErrorCode::IllegalConfiguration);
    }
  }

  if (config->kill_delay_secs > 0 && config->timeout_secs == 0) {
    PRINT_DEBUG("kill delay given without a timeout, ignoring it");
  }
  if (config->commit_message.empty()) {
    config->commit_message = DEFAULT_COMMIT_MESSAGE;
  }
  if (config->host_path.empty()) {
    config->host_path = DEFAULT_SANDBOX_PATH;
  }

  ResolveSandboxEnvironment(env, config);
  return 0;
}

int ParseOptions(int argc, char* argv[], char** envp, HarnessConfig* config) {
  EnvMap env = EnvironmentToMap(envp);
  if (LoadEnvironment(env, config) < 0) {
    return -1;
  }

  vector<char*> args(argv, argv + argc);
  if (args.empty()) {
    return TbxReportErrorAndMessage("empty argument vector",
                                    ErrorCode::IllegalConfiguration);
  }
  std::deque<std::string> storage;
  unique_ptr<vector<char*>> expanded = ExpandArguments(args, &storage);
  if (expanded == nullptr) {
    return -1;
  }
  if (ParseCommandLine(std::move(expanded), config) < 0) {
    return -1;
  }

  return ValidateConfig(env, config);
}
