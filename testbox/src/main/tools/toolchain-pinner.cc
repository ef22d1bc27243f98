/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/toolchain-pinner.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

#define INSTALL_OUTPUT_EXCERPT 512

static const std::regex& VersionPattern() {
  static const std::regex pattern(
      "[0-9]+(\\.[0-9]+){2,}(-[0-9A-Za-z.-]+)?(\\+[0-9A-Za-z.-]+)?");
  return pattern;
}


bool IsExactVersion(const std::string& version) {
  return std::regex_match(version, VersionPattern());
}


std::string ExtractVersion(const std::string& output) {
  std::istringstream in(output);
  std::string token;
  while (in >> token) {
    // Strip punctuation around the token, e.g. "(1.2.3)," or "1.2.3:".
    while (!token.empty() && !isalnum(static_cast<unsigned char>(token.back())))
      token.pop_back();
    size_t i = 0;
    while (i < token.size() && !isdigit(static_cast<unsigned char>(token[i]))) {
      if (!isalpha(static_cast<unsigned char>(token[i]))) break;
      i++;
    }
    // Allow a letter prefix such as "v1.2.3" or "go1.21.0" only.
    if (i >= token.size() || !isdigit(static_cast<unsigned char>(token[i])))
      continue;
    const std::string candidate = token.substr(i);
    if (std::regex_match(candidate, VersionPattern())) {
      return candidate;
    }
  }
  return "";
}


static void ReplaceAll(std::string& s, const std::string& from,
                       const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}


std::string ExpandToolchainTemplate(const std::string& tmpl,
                                    const ToolchainSpec& spec,
                                    const std::string& prefix) {
  std::string out = tmpl;
  ReplaceAll(out, "{name}", spec.name);
  ReplaceAll(out, "{version}", spec.version);
  ReplaceAll(out, "{source}", spec.source);
  ReplaceAll(out, "{prefix}", prefix);
  return out;
}


static bool IsDirectory(const std::string& path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}


static std::string Excerpt(const std::string& output) {
  if (output.size() <= INSTALL_OUTPUT_EXCERPT) return Trim(output);
  return "..." + Trim(output.substr(output.size() - INSTALL_OUTPUT_EXCERPT));
}


static int ValidateSpec(const ToolchainSpec& spec) {
  if (spec.name.empty() || spec.name.find('/') != std::string::npos ||
      spec.name == "." || spec.name == "..") {
    return TbxReportErrorAndMessage("bad toolchain name '" + spec.name + "'",
                                    ErrorCode::InvalidToolchainSpec);
  }
  if (!IsExactVersion(spec.version)) {
    return TbxReportErrorAndMessage(
        spec.name + "@" + spec.version + " is not an exact version",
        ErrorCode::InvalidToolchainSpec);
  }
  if (spec.root.empty() || spec.root[0] != '/') {
    return TbxReportErrorAndMessage("toolchain root " + spec.root,
                                    ErrorCode::NotAnAbsolutePath);
  }
  return 0;
}


static int Unavailable(const ToolchainSpec& spec, const std::string& why) {
  return TbxReportErrorAndMessage(spec.name + "@" + spec.version + ": " + why,
                                  ErrorCode::ToolchainUnavailable);
}


static int InstallToolchain(const ToolchainSpec& spec, const std::string& dir,
                            const std::string& prefix) {
  if (spec.install_command.empty()) {
    return Unavailable(spec, "not installed in " + prefix +
                                 " and no install command configured");
  }
  const std::string cmd = ExpandToolchainTemplate(spec.install_command, spec, prefix);
  PRINT_INFO("installing %s %s", spec.name.c_str(), spec.version.c_str());
  PRINT_DEBUG("install command: %s", cmd.c_str());

  CommandResult res;
  std::string why;
  if (RunCommand({"/bin/sh", "-c", cmd}, {}, dir, TOOLCHAIN_COMMAND_TIMEOUT_SECS,
                 &res) < 0) {
    why = std::string("installer could not be started: ") + TbxGetErrorMsg();
  } else if (res.timed_out) {
    why = "installer timed out";
  } else if (res.exit_code != 0) {
    why = "installer exited with " + std::to_string(res.exit_code) + ": " +
          Excerpt(res.output);
  } else if (!IsDirectory(prefix)) {
    why = "installer succeeded but did not create " + prefix;
  }

  if (!why.empty()) {
    // A half-written prefix would look installed to the next run.
    RemoveDirectoryTree(prefix);
    return Unavailable(spec, why);
  }
  return 0;
}


static int VerifyVersion(const ToolchainSpec& spec, const std::string& prefix,
                         std::string* reported) {
  const std::string cmd = ExpandToolchainTemplate(
      spec.version_command.empty() ? DEFAULT_VERSION_COMMAND
                                   : spec.version_command,
      spec, prefix);
  PRINT_DEBUG("version command: %s", cmd.c_str());

  CommandResult res;
  if (RunCommand({"/bin/sh", "-c", cmd}, {}, prefix,
                 TOOLCHAIN_COMMAND_TIMEOUT_SECS, &res) < 0) {
    return Unavailable(spec, std::string("version query could not be started: ") +
                                 TbxGetErrorMsg());
  }
  if (res.timed_out || res.exit_code != 0) {
    return Unavailable(spec, "version query failed: " + Excerpt(res.output));
  }
  *reported = ExtractVersion(res.output);
  if (reported->empty()) {
    return Unavailable(spec, "no version in output of '" + cmd + "'");
  }
  if (*reported != spec.version) {
    return TbxReportErrorAndMessage(
        spec.name + " pinned to " + spec.version + " but " + prefix +
            " reports " + *reported,
        ErrorCode::VersionMismatch);
  }
  return 0;
}


// Points <dir>/current at <version> without a moment where it is missing.
static int SelectVersion(const ToolchainSpec& spec, const std::string& dir) {
  const std::string link = dir + "/" TOOLCHAIN_CURRENT_LINK;
  const std::string tmp_link = link + ".tmp." + std::to_string(getpid());
  unlink(tmp_link.c_str());
  if (symlink(spec.version.c_str(), tmp_link.c_str()) < 0) {
    return Unavailable(spec, std::string("symlink ") + tmp_link + ": " +
                                 strerror(errno));
  }
  if (rename(tmp_link.c_str(), link.c_str()) < 0) {
    int saved_errno = errno;
    unlink(tmp_link.c_str());
    return Unavailable(spec, std::string("rename ") + link + ": " +
                                 strerror(saved_errno));
  }
  PRINT_DEBUG("%s -> %s", link.c_str(), spec.version.c_str());
  return 0;
}


int PinToolchain(const ToolchainSpec& spec, PinnedToolchain* out) {
  if (ValidateSpec(spec) < 0) return UNRECOVERABLE_FAIL;

  const std::string dir = spec.root + "/" + spec.name;
  const std::string prefix = dir + "/" + spec.version;
  if (CreateDirectories(dir) < 0) {
    return Unavailable(spec, TbxGetErrorMsg());
  }

  ScopedFileLock lock;
  if (lock.Acquire(dir + "/" TOOLCHAIN_LOCK_FILE) < 0) {
    return Unavailable(spec, TbxGetErrorMsg());
  }

  // Checked under the lock: another run may have installed it meanwhile.
  bool fresh_install = false;
  if (!IsDirectory(prefix)) {
    if (InstallToolchain(spec, dir, prefix) < 0) return UNRECOVERABLE_FAIL;
    fresh_install = true;
  } else {
    PRINT_DEBUG("%s already installed", prefix.c_str());
  }

  std::string reported;
  if (VerifyVersion(spec, prefix, &reported) < 0) {
    if (fresh_install) {
      const TbxError err = TbxGetLastError();
      RemoveDirectoryTree(prefix);
      TbxSetError(err.msg, err.code);
    }
    return UNRECOVERABLE_FAIL;
  }

  if (SelectVersion(spec, dir) < 0) return UNRECOVERABLE_FAIL;

  out->prefix = prefix;
  out->bin_dir = prefix + "/bin";
  out->verified_version = reported;
  PRINT_INFO("toolchain %s %s pinned at %s", spec.name.c_str(),
             reported.c_str(), prefix.c_str());
  return 0;
}
