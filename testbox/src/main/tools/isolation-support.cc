/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/isolation-support.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <mntent.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <map>
#include <mutex>

const char* IsolationModeName(IsolationMode mode) {
  return mode == ISOLATION_BEST_EFFORT ? "best-effort" : "namespaces";
}

static bool isDockerEnvPresent() {
  std::error_code ec;
  return fs::exists(fs::path("/.dockerenv"), ec);
}

static bool isRootInOverlay() {
  FILE *mounts = setmntent("/proc/self/mounts", "r");
  struct mntent *ent;
  if (mounts == nullptr) {
    return false;
  }

  bool overlay = false;
  while ((ent = getmntent(mounts)) != nullptr) {
    if (strcmp(ent->mnt_dir, "/") == 0) {
      overlay = (strcmp(ent->mnt_type, "overlay") == 0);
    }
  }
  endmntent(mounts);
  return overlay;
}

bool isRunningInDocker() { return isDockerEnvPresent() || isRootInOverlay(); }


int NamespaceCloneFlags(bool network_enabled, bool caller_is_root) {
  int flags = CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS;
  if (!network_enabled) flags |= CLONE_NEWNET;
  if (!caller_is_root) flags |= CLONE_NEWUSER;
  return flags;
}


// Code heavily inspired by
//https://github.com/mozilla-firefox/firefox/blob/131497bb1b747587b2b21b1abf14f44ecffad805/security/sandbox/linux/SandboxInfo.cpp
static bool ProbeNamespaces(int flags) {
  pid_t pid = static_cast<pid_t>(
      syscall(__NR_clone, SIGCHLD | flags, nullptr, nullptr, nullptr, nullptr));

  if (pid == 0) {
    _exit(0);
  }

  if (pid == -1) {
    PRINT_DEBUG("namespace probe clone(0x%x) failed: %s", flags,
                strerror(errno));
    return false;
  }

  int status = 0;
  pid_t w;
  do {
    w = waitpid(pid, &status, 0);
  } while (w == -1 && errno == EINTR);

  if (w == -1) {
    return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}


bool CanCreateNamespaces(int flags) {
  static std::mutex mu;
  static std::map<int, bool> probed;
  std::lock_guard<std::mutex> lock(mu);
  auto it = probed.find(flags);
  if (it != probed.end()) return it->second;
  bool ok = ProbeNamespaces(flags);
  probed[flags] = ok;
  PRINT_DEBUG("namespaces 0x%x %s", flags, ok ? "available" : "unavailable");
  return ok;
}


std::string NamespaceSupportHint() {
  if (isRunningInDocker()) {
    return "the harness seems to run inside a container that does not allow "
           "creating namespaces; run the container with --privileged or "
           "request best-effort isolation (-x)";
  }
  return "unprivileged user namespaces may be disabled on this host "
         "(kernel.unprivileged_userns_clone, user.max_user_namespaces or an "
         "AppArmor restriction)";
}
