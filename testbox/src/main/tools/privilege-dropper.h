/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_PRIVILEGE_DROPPER_H_
#define SRC_MAIN_TOOLS_PRIVILEGE_DROPPER_H_

#include <stdint.h>
#include <sys/types.h>

#include <string>

#define CAP_BIT(n) (1ULL << (n))

// The unprivileged account sandboxed commands run as.
struct TargetIdentity {
  uid_t uid = 0;
  gid_t gid = 0;
  std::string name;
};

// Looks `user` (name or numeric uid) and the optional `group` up in the host
// account database. Fails with PrivilegeDropFailed when the account does not
// exist or is root. Runs in the harness, before any child is created.
int ResolveTargetUser(const std::string& user, const std::string& group,
                      TargetIdentity* out);

// Runs in the sandboxed child right before execve. With `switch_identity`
// the process is root and moves to `target`; otherwise a user namespace
// already maps it onto `target` and only capabilities are dropped. Every
// capability not in `retained_caps` is removed from the bounding, effective
// and permitted sets, no_new_privs is set and the result is verified.
int DropPrivileges(const TargetIdentity& target, uint64_t retained_caps,
                   bool switch_identity);

// Removes every capability outside `keep` from the bounding set.
int DropBoundingSet(uint64_t keep);

// Checks that no uid of the process is `elevated_uid` and that the process
// cannot get it back.
int VerifyPrivilegesDropped(uid_t elevated_uid);

#endif  // SRC_MAIN_TOOLS_PRIVILEGE_DROPPER_H_
