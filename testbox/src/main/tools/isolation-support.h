/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */


#ifndef ISOLATION_SUPPORT_H_
#define ISOLATION_SUPPORT_H_

#include <string>

enum IsolationMode {
  // Full namespace sandbox. Fails closed when the host cannot provide it.
  ISOLATION_NAMESPACES,
  // Own process group and dropped privileges only. Must be asked for.
  ISOLATION_BEST_EFFORT
};

const char* IsolationModeName(IsolationMode mode);

// Heuristic: /.dockerenv or an overlay root filesystem.
bool isRunningInDocker();

// Namespaces the sandbox needs for a run. The user namespace is only added
// for unprivileged callers and the network namespace only when network
// access is disabled.
int NamespaceCloneFlags(bool network_enabled, bool caller_is_root);

// Forks a throw-away child into the namespaces in `flags` to find out whether
// this host lets us create them. The answer is cached per flag set.
bool CanCreateNamespaces(int flags);

// Explains a failed probe to the operator, e.g. that the harness is running
// in an unprivileged container.
std::string NamespaceSupportHint();

#endif
