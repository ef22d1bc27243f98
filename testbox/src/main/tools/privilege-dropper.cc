/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/privilege-dropper.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <linux/capability.h>

#include <cctype>
#include <vector>

#define CAP_VERSION _LINUX_CAPABILITY_VERSION_3
#define CAP_WORDS   _LINUX_CAPABILITY_U32S_3

#ifndef PR_CAP_AMBIENT
#define PR_CAP_AMBIENT 47
#define PR_CAP_AMBIENT_RAISE 2
#endif

static bool IsNumeric(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}


static long LookupBufferSize(int name) {
  long size = sysconf(name);
  return size > 0 ? size : 16384;
}


int ResolveTargetUser(const std::string& user, const std::string& group,
                      TargetIdentity* out) {
  if (user.empty()) {
    return TbxReportErrorAndMessage("no unprivileged user configured",
                                    ErrorCode::PrivilegeDropFailed);
  }

  struct passwd pwd;
  struct passwd* pw_result = nullptr;
  std::vector<char> buf(LookupBufferSize(_SC_GETPW_R_SIZE_MAX));
  int rc;
  if (IsNumeric(user)) {
    rc = getpwuid_r(static_cast<uid_t>(strtoul(user.c_str(), nullptr, 10)),
                    &pwd, buf.data(), buf.size(), &pw_result);
  } else {
    rc = getpwnam_r(user.c_str(), &pwd, buf.data(), buf.size(), &pw_result);
  }
  if (rc != 0 || pw_result == nullptr) {
    return TbxReportErrorAndMessage("unknown user " + user,
                                    ErrorCode::PrivilegeDropFailed);
  }
  if (pwd.pw_uid == 0) {
    return TbxReportErrorAndMessage("refusing to run as " + user + " (uid 0)",
                                    ErrorCode::PrivilegeDropFailed);
  }
  out->uid = pwd.pw_uid;
  out->gid = pwd.pw_gid;
  out->name = pwd.pw_name;

  if (!group.empty()) {
    struct group grp;
    struct group* gr_result = nullptr;
    std::vector<char> gbuf(LookupBufferSize(_SC_GETGR_R_SIZE_MAX));
    if (IsNumeric(group)) {
      rc = getgrgid_r(static_cast<gid_t>(strtoul(group.c_str(), nullptr, 10)),
                      &grp, gbuf.data(), gbuf.size(), &gr_result);
    } else {
      rc = getgrnam_r(group.c_str(), &grp, gbuf.data(), gbuf.size(),
                      &gr_result);
    }
    if (rc != 0 || gr_result == nullptr) {
      return TbxReportErrorAndMessage("unknown group " + group,
                                      ErrorCode::PrivilegeDropFailed);
    }
    if (grp.gr_gid == 0) {
      return TbxReportErrorAndMessage("refusing to run with group " + group,
                                      ErrorCode::PrivilegeDropFailed);
    }
    out->gid = grp.gr_gid;
  }

  PRINT_DEBUG("target identity %s uid=%d gid=%d", out->name.c_str(),
              out->uid, out->gid);
  return 0;
}


static bool HasEffectiveCap(int cap) {
  struct __user_cap_header_struct hdr = {
    .version = CAP_VERSION,
    .pid = 0,
  };
  struct __user_cap_data_struct data[CAP_WORDS];
  if (syscall(SYS_capget, &hdr, data)) return false;
  return (data[cap / 32].effective & (1U << (cap % 32))) != 0;
}


int DropBoundingSet(uint64_t keep) {
  // Without CAP_SETPCAP the bounding set cannot shrink. Such a caller holds
  // nothing worth bounding, and no_new_privs keeps file capabilities off.
  if (!HasEffectiveCap(CAP_SETPCAP)) {
    PRINT_DEBUG("no CAP_SETPCAP, leaving the bounding set alone");
    return 0;
  }
  for (int cap = 0; cap <= CAP_LAST_CAP; cap++) {
    if (keep & CAP_BIT(cap)) continue;
    if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) < 0 && errno != EINVAL) {
      return TbxReportErrorAndMessage(
          "PR_CAPBSET_DROP(" + std::to_string(cap) + "): " + strerror(errno),
          ErrorCode::PrivilegeDropFailed);
    }
  }
  return 0;
}


static int drop_caps_ep_except(uint64_t keep) {
  struct __user_cap_header_struct hdr = {
    .version = CAP_VERSION,
    .pid = 0,
  };
  struct __user_cap_data_struct data[CAP_WORDS];
  int i;

  if (syscall(SYS_capget, &hdr, data))
    return TbxReportErrorAndMessage(std::string("capget: ") + strerror(errno),
                                    ErrorCode::PrivilegeDropFailed);

  for (i = 0; i < CAP_WORDS; i++) {
    uint32_t mask = static_cast<uint32_t>(keep >> (32 * i));

    data[i].effective &= mask;
    data[i].permitted &= mask;
    // Ambient raising needs the bit in both permitted and inheritable.
    data[i].inheritable = data[i].permitted;
  }

  if (syscall(SYS_capset, &hdr, data))
    return TbxReportErrorAndMessage(std::string("capset: ") + strerror(errno),
                                    ErrorCode::PrivilegeDropFailed);
  return 0;
}


// Capabilities only survive execve for a non-root uid as ambient ones.
static int RaiseAmbient(uint64_t keep) {
  for (int cap = 0; cap <= CAP_LAST_CAP; cap++) {
    if (!(keep & CAP_BIT(cap))) continue;
    if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_RAISE, cap, 0, 0) < 0) {
      return TbxReportErrorAndMessage(
          "PR_CAP_AMBIENT_RAISE(" + std::to_string(cap) + "): " +
              strerror(errno),
          ErrorCode::PrivilegeDropFailed);
    }
  }
  return 0;
}


static int SwitchIdentity(const TargetIdentity& target, uint64_t retained_caps) {
  if (retained_caps != 0 && prctl(PR_SET_KEEPCAPS, 1, 0, 0, 0) < 0) {
    return TbxReportErrorAndMessage(
        std::string("PR_SET_KEEPCAPS: ") + strerror(errno),
        ErrorCode::PrivilegeDropFailed);
  }
  if (setgroups(1, &target.gid) < 0) {
    return TbxReportErrorAndMessage(std::string("setgroups: ") + strerror(errno),
                                    ErrorCode::PrivilegeDropFailed);
  }
  if (setresgid(target.gid, target.gid, target.gid) < 0) {
    return TbxReportErrorAndMessage(
        "setresgid(" + std::to_string(target.gid) + "): " + strerror(errno),
        ErrorCode::PrivilegeDropFailed);
  }
  if (setresuid(target.uid, target.uid, target.uid) < 0) {
    return TbxReportErrorAndMessage(
        "setresuid(" + std::to_string(target.uid) + "): " + strerror(errno),
        ErrorCode::PrivilegeDropFailed);
  }
  return 0;
}


int VerifyPrivilegesDropped(uid_t elevated_uid) {
  uid_t ruid, euid, suid;
  if (getresuid(&ruid, &euid, &suid) < 0) {
    return TbxReportErrorAndMessage(std::string("getresuid: ") + strerror(errno),
                                    ErrorCode::PrivilegeDropFailed);
  }
  if (ruid == elevated_uid || euid == elevated_uid || suid == elevated_uid) {
    return TbxReportErrorAndMessage(
        "process still holds uid " + std::to_string(elevated_uid),
        ErrorCode::PrivilegeDropFailed);
  }
  if (setuid(elevated_uid) == 0) {
    return TbxReportErrorAndMessage(
        "process was able to regain uid " + std::to_string(elevated_uid),
        ErrorCode::PrivilegeDropFailed);
  }
  return 0;
}


int DropPrivileges(const TargetIdentity& target, uint64_t retained_caps,
                   bool switch_identity) {
  if (DropBoundingSet(retained_caps) < 0) return UNRECOVERABLE_FAIL;

  if (switch_identity && SwitchIdentity(target, retained_caps) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
    return TbxReportErrorAndMessage(
        std::string("PR_SET_NO_NEW_PRIVS: ") + strerror(errno),
        ErrorCode::PrivilegeDropFailed);
  }

  if (drop_caps_ep_except(retained_caps) < 0) return UNRECOVERABLE_FAIL;
  if (retained_caps != 0 && RaiseAmbient(retained_caps) < 0) {
    return UNRECOVERABLE_FAIL;
  }

  // Inside a user namespace uid 0 is the namespace owner, i.e. the caller.
  return VerifyPrivilegesDropped(0);
}
