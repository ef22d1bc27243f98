/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_TOOLCHAIN_PINNER_H_
#define SRC_MAIN_TOOLS_TOOLCHAIN_PINNER_H_

#include <string>

#define DEFAULT_TOOLCHAIN_ROOT "/opt/testbox/toolchains"
#define DEFAULT_VERSION_COMMAND "{prefix}/bin/{name} --version"
#define TOOLCHAIN_CURRENT_LINK "current"
#define TOOLCHAIN_LOCK_FILE ".install.lock"
#define TOOLCHAIN_COMMAND_TIMEOUT_SECS 1800

struct ToolchainSpec {
  std::string name;
  // Exact version, e.g. 1.21.0 or 2.0.0-rc1+build5.
  std::string version;
  // Handed to the installer as {source}.
  std::string source;
  // Installs go to <root>/<name>/<version>.
  std::string root = DEFAULT_TOOLCHAIN_ROOT;
  // Templates run through /bin/sh -c with {name}, {version}, {source} and
  // {prefix} substituted.
  std::string install_command;
  std::string version_command = DEFAULT_VERSION_COMMAND;
};

struct PinnedToolchain {
  std::string prefix;
  std::string bin_dir;
  std::string verified_version;
};

// True for MAJOR.MINOR.PATCH with optional -prerelease and +build parts.
// Channel names, wildcards and ranges are not exact.
bool IsExactVersion(const std::string& version);

// First token of `output` that looks like a version, without a leading "v".
// Empty when there is none.
std::string ExtractVersion(const std::string& output);

// Replaces {name}, {version}, {source} and {prefix} in `tmpl`.
std::string ExpandToolchainTemplate(const std::string& tmpl,
                                    const ToolchainSpec& spec,
                                    const std::string& prefix);

// Makes sure <root>/<name>/<version> holds exactly spec.version and points
// <root>/<name>/current at it. Installs it first when missing, holding the
// install lock of the toolchain. Fails with ToolchainUnavailable when the
// version cannot be installed or queried and with VersionMismatch when the
// installed toolchain reports another version. Never retries.
int PinToolchain(const ToolchainSpec& spec, PinnedToolchain* out);

#endif  // SRC_MAIN_TOOLS_TOOLCHAIN_PINNER_H_
