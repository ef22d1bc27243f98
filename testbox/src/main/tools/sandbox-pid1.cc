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

/**
 * This is PID 1 inside the sandbox environment. It runs in separate mount,
 * PID, IPC and UTS namespaces, in a network namespace unless network access
 * was granted, and in a user namespace when the harness is not root.
 *
 * It assembles a fresh root filesystem on a tmpfs, pivots into it, starts
 * the command as PID 2 and reports how it ended.
 */

#include "src/main/tools/sandbox-pid1.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <libgen.h>
#include <net/if.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef MS_REC
// Some systems do not define MS_REC in sys/mount.h. We might be able to grab it
// from linux/fs.h instead (cf. #2667).
#include <linux/fs.h>
#endif

#include <string>

#ifndef TEMP_FAILURE_RETRY
// Some C standard libraries like musl do not define this macro, so we'll
// include our own version for compatibility.
#define TEMP_FAILURE_RETRY(exp)                                                \
  ({                                                                           \
    decltype(exp) _rc;                                                         \
    do {                                                                       \
      _rc = (exp);                                                             \
    } while (_rc == -1 && errno == EINTR);                                     \
    _rc;                                                                       \
  })
#endif // TEMP_FAILURE_RETRY

static pid_t global_child_pid = 0;


void SendChildReport(int fd, const ChildReport& report) {
  // Nothing else can be done if the harness is gone.
  if (WriteFully(fd, &report, sizeof(report)) < 0) {
    PRINT_DEBUG("could not send report: %s", strerror(errno));
  }
}


void ReportChildFailure(int fd, ErrorCode code) {
  ChildReport report = {};
  report.kind = kSetupFailed;
  report.code = static_cast<int>(code);
  report.sys_errno = errno;
  strncpy(report.msg, TbxGetErrorMsg(), MAX_ERR_LEN - 1);
  SendChildReport(fd, report);
  _exit(EXIT_FAILURE);
}


// Helper methods
static int CreateFile(const char *path) {
  int handle = open(path, O_CREAT | O_WRONLY | O_EXCL, 0666);
  if (handle < 0) {
    return TbxReportSysError(std::string("open(") + path + ")");
  }
  if (close(handle) < 0) {
    return TbxReportSysError("close");
  }
  return 0;
}

// Recursively creates the file or directory specified in "path" and its parent
// directories.
// Return -1 on failure and sets errno to:
//    EINVAL   path is null
//    ENOTDIR  path exists and is not a directory
//    EEXIST   path exists and is a directory
//    ENOENT   stat call with the path failed
static int CreateTarget(const char *path, bool is_directory) {
  if (path == NULL) {
    errno = EINVAL;
    return -1;
  }

  struct stat sb;
  if (stat(path, &sb) == 0) {
    if (is_directory && S_ISDIR(sb.st_mode)) {
      return 0;
    } else if (!is_directory && S_ISREG(sb.st_mode)) {
      return 0;
    } else {
      errno = is_directory ? ENOTDIR : EEXIST;
      return -1;
    }
  } else if (errno != ENOENT) {
    return -1;
  }

  std::string parent(path);
  char *dir = dirname(&parent[0]);
  if (CreateTarget(dir, true) < 0) {
    return -1;
  }

  if (is_directory) {
    if (mkdir(path, 0755) < 0) {
      return -1;
    }
  } else if (CreateFile(path) < 0) {
    return -1;
  }
  return 0;
}


static int SetupSelfDestruction(int *pipe_to_parent) {
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0) {
    return TbxReportSysError("prctl(PR_SET_PDEATHSIG)");
  }

  // Switch to a new process group, otherwise our process group will still refer
  // to the outer PID namespace. We might then accidentally kill our parent by a
  // call to e.g. `kill(0, sig)`.
  if (setpgid(0, 0) < 0) {
    return TbxReportSysError("setpgid");
  }

  // Verify that the parent still lives.
  if (SignalPipe(pipe_to_parent) < 0) {
    return TbxReportSysError("signal parent");
  }
  return 0;
}


// Maps the target identity onto the harness' own uid/gid. The sandboxed
// command then runs as the target user without the harness being root.
static int SetupUserNamespace(const Pid1Args &args) {
  // Disable needs for CAP_SETGID.
  struct stat sb;
  if (stat("/proc/self/setgroups", &sb) == 0) {
    if (WriteFile("/proc/self/setgroups", "deny") < 0) {
      return TbxReportSysError("write /proc/self/setgroups");
    }
  } else if (errno != ENOENT) {
    // Older Linux versions do not have this file (but also do not require
    // writing to it).
    return TbxReportSysError("stat(/proc/self/setgroups)");
  }

  if (WriteFile("/proc/self/uid_map", "%u %u 1\n", args.target->uid,
                args.outer_uid) < 0) {
    return TbxReportSysError("write /proc/self/uid_map");
  }
  if (WriteFile("/proc/self/gid_map", "%u %u 1\n", args.target->gid,
                args.outer_gid) < 0) {
    return TbxReportSysError("write /proc/self/gid_map");
  }
  return 0;
}


static int SetupMountNamespace() {
  // Isolate only mounts in the slave (us) but not mounts in the master.
  // This is needed to support autofs
  if (mount(nullptr, "/", nullptr, MS_REC | MS_SLAVE, nullptr) < 0) {
    return TbxReportSysError("mount(/, MS_REC | MS_SLAVE)");
  }
  return 0;
}


static int SetupUtsNamespace() {
  if (sethostname(SANDBOX_HOSTNAME, strlen(SANDBOX_HOSTNAME)) < 0) {
    return TbxReportSysError("sethostname");
  }
  if (setdomainname(SANDBOX_DOMAINNAME, strlen(SANDBOX_DOMAINNAME)) < 0) {
    return TbxReportSysError("setdomainname");
  }
  return 0;
}


// Puts an empty tmpfs on the sandbox root; only what is mounted below it
// afterwards will be visible.
static int MountSandboxAndGoThere(const std::string &sandbox_root) {
  if (mount("tmpfs", sandbox_root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
            "mode=0755") < 0) {
    return TbxReportSysError("mount(tmpfs, " + sandbox_root + ")");
  }
  PRINT_DEBUG("mounted tmpfs on %s", sandbox_root.c_str());
  if (chdir(sandbox_root.c_str()) < 0) {
    return TbxReportSysError("chdir(" + sandbox_root + ")");
  }
  return 0;
}


static int MountDev() {
  if (CreateTarget("dev", true) < 0) {
    return TbxReportSysError("CreateTarget dev");
  }
  const char *devs[] = {"/dev/null", "/dev/random", "/dev/urandom", "/dev/zero",
                        NULL};
  for (int i = 0; devs[i] != NULL; i++) {
    if (CreateTarget(devs[i] + 1, false) < 0) {
      return TbxReportSysError(std::string("CreateTarget ") + devs[i]);
    }
    if (mount(devs[i], devs[i] + 1, NULL, MS_BIND, NULL) < 0) {
      return TbxReportSysError(std::string("mount ") + devs[i]);
    }
  }
  if (symlink("/proc/self/fd", "dev/fd") < 0) {
    return TbxReportSysError("symlink dev/fd");
  }
  if (CreateTarget("dev/shm", true) < 0 ||
      mount("tmpfs", "dev/shm", "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC,
            nullptr) < 0) {
    return TbxReportSysError("mount dev/shm");
  }
  return 0;
}


// Turns the bind mount at `target` read-only while keeping the nosuid, nodev,
// noexec and atime flags of the host mount of `source`; a locked flag left out
// would make the remount fail inside a user namespace.
static int RemountRO(const std::string &source, const std::string &target) {
  struct statvfs vfs;
  int mountFlags = MS_BIND | MS_REMOUNT | MS_RDONLY;
  if (statvfs(source.c_str(), &vfs) < 0) {
    return TbxReportSysError("statvfs(" + source + ")");
  }
  if (vfs.f_flag & ST_NOSUID) {
    mountFlags |= MS_NOSUID;
  }
  if (vfs.f_flag & ST_NODEV) {
    mountFlags |= MS_NODEV;
  }
  if (vfs.f_flag & ST_NOEXEC) {
    mountFlags |= MS_NOEXEC;
  }
  if (vfs.f_flag & ST_NOATIME) {
    mountFlags |= MS_NOATIME;
  }
  if (vfs.f_flag & ST_NODIRATIME) {
    mountFlags |= MS_NODIRATIME;
  }
  if (vfs.f_flag & ST_RELATIME) {
    mountFlags |= MS_RELATIME;
  }
  if (mount(nullptr, target.c_str(), NULL, mountFlags, NULL) < 0) {
    return TbxReportSysError("remount read-only " + target);
  }
  PRINT_DEBUG("remounted %s read-only", target.c_str());
  return 0;
}


static int BindMount(const std::string &sandbox_root, const std::string &item,
                     bool read_only) {
  const std::string full_sandbox_path(sandbox_root + item);
  struct stat sb;
  if (stat(item.c_str(), &sb) < 0) {
    return TbxReportSysError("stat(" + item + ")");
  }
  if (CreateTarget(full_sandbox_path.c_str(), S_ISDIR(sb.st_mode)) < 0) {
    return TbxReportSysError("CreateTarget " + full_sandbox_path);
  }
  if (mount(item.c_str(), full_sandbox_path.c_str(), NULL, MS_REC | MS_BIND,
            NULL) < 0) {
    return TbxReportSysError("mount(" + item + ", MS_BIND)");
  }
  PRINT_DEBUG("%s mount: %s", read_only ? "ro" : "rw", item.c_str());
  if (read_only) {
    return RemountRO(item, full_sandbox_path);
  }
  return 0;
}


static int MountAllMounts(const Pid1Args &args) {
  const SandboxPolicy &policy = *args.policy;
  for (const std::string &path : policy.readonly_paths) {
    if (BindMount(args.sandbox_root, path, true) < 0) return UNRECOVERABLE_FAIL;
  }
  for (const std::string &path : policy.writable_paths) {
    if (BindMount(args.sandbox_root, path, false) < 0) return UNRECOVERABLE_FAIL;
  }
  // The workspace is always writable, even below a read-only path.
  return BindMount(args.sandbox_root, args.request->working_dir, false);
}


static int MountProcAndTmp() {
  // A new proc, because the host one still refers to our parent PID namespace.
  if (CreateTarget("proc", true) < 0 ||
      mount("proc", "proc", "proc", MS_NODEV | MS_NOEXEC | MS_NOSUID,
            nullptr) < 0) {
    return TbxReportSysError("mount proc");
  }
  if (CreateTarget("tmp", true) < 0 ||
      mount("tmpfs", "tmp", "tmpfs", MS_NOSUID | MS_NODEV, "mode=1777") < 0) {
    return TbxReportSysError("mount tmp");
  }
  return 0;
}


static int ChangeRoot() {
  // move the real root to old_root, then detach it
  char old_root[16] = "old-root-XXXXXX";
  if (mkdtemp(old_root) == NULL) {
    return TbxReportSysError("mkdtemp");
  }
  // pivot_root has no wrapper in libc, so we need syscall()
  if (syscall(SYS_pivot_root, ".", old_root) < 0) {
    return TbxReportSysError("pivot_root");
  }
  if (chroot(".") < 0) {
    return TbxReportSysError("chroot");
  }
  if (umount2(old_root, MNT_DETACH) < 0) {
    return TbxReportSysError("umount2");
  }
  if (rmdir(old_root) < 0) {
    return TbxReportSysError("rmdir");
  }
  // Nothing may be created next to the mounted paths.
  if (mount(nullptr, "/", nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID |
                                       MS_NODEV, nullptr) < 0) {
    return TbxReportSysError("remount / read-only");
  }
  return 0;
}


// Only the loopback interface exists in a fresh network namespace and it
// starts down.
static int SetupNetworking() {
  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    return TbxReportSysError("socket");
  }
  ScopedFd sock(fd);

  struct ifreq ifr = {};
  strncpy(ifr.ifr_name, "lo", IF_NAMESIZE);

  // Verify that name is valid.
  if (if_nametoindex(ifr.ifr_name) == 0) {
    return TbxReportSysError("if_nametoindex(lo)");
  }

  ifr.ifr_flags |= IFF_UP;
  if (ioctl(sock.get(), SIOCSIFFLAGS, &ifr) < 0) {
    return TbxReportSysError("ioctl(SIOCSIFFLAGS)");
  }
  return 0;
}


static int ApplyResourceLimits(const ResourceLimits &limits) {
  struct rlimit rl;
  if (limits.max_open_files >= 0) {
    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.max_open_files);
    if (setrlimit(RLIMIT_NOFILE, &rl) < 0) {
      return TbxReportSysError("setrlimit(RLIMIT_NOFILE)");
    }
  }
  if (limits.max_file_size >= 0) {
    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.max_file_size);
    if (setrlimit(RLIMIT_FSIZE, &rl) < 0) {
      return TbxReportSysError("setrlimit(RLIMIT_FSIZE)");
    }
  }
  if (limits.disable_core_dumps) {
    rl.rlim_cur = rl.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &rl) < 0) {
      return TbxReportSysError("setrlimit(RLIMIT_CORE)");
    }
  }
  return 0;
}


// Make sure the command does not inherit any accidentally left open file
// handles from the harness.
static void CloseFds(int keep_fd) {
  DIR *fds = opendir("/proc/self/fd");
  if (fds == nullptr) {
    return;
  }

  while (1) {
    errno = 0;
    struct dirent *dent = readdir(fds);
    if (dent == nullptr) {
      break;
    }

    if (isdigit(dent->d_name[0])) {
      errno = 0;
      int fd = strtol(dent->d_name, nullptr, 10);

      // Close everything except stdin, stdout, stderr, the report pipe and our
      // directory handle.
      if (errno == 0 && fd > STDERR_FILENO && fd != keep_fd &&
          fd != dirfd(fds)) {
        close(fd);
      }
    }
  }
  closedir(fds);
}


void ExecSandboxedCommand(const Pid1Args &args, bool switch_identity) {
  const int report_fd = args.report_fd;

  // Start with default signal handlers and an empty signal mask.
  ClearSignalMask();

  int devnull = open("/dev/null", O_RDONLY);
  if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
      dup2(args.stdout_fd, STDOUT_FILENO) < 0 ||
      dup2(args.stderr_fd, STDERR_FILENO) < 0) {
    TbxReportSysError("redirect stdio");
    ReportChildFailure(report_fd, ErrorCode::SandboxSetupError);
  }
  if (global_debug) {
    fclose(global_debug);
    global_debug = nullptr;
  }
  CloseFds(report_fd);

  // Force umask to include read and execute for everyone, to make output
  // permissions predictable.
  umask(022);

  if (ApplyResourceLimits(args.policy->limits) < 0) {
    ReportChildFailure(report_fd, ErrorCode::SandboxSetupError);
  }

  if (DropPrivileges(*args.target, args.policy->retained_capabilities,
                     switch_identity) < 0) {
    ReportChildFailure(report_fd, ErrorCode::PrivilegeDropFailed);
  }

  if (chdir(args.request->working_dir.c_str()) < 0) {
    TbxReportSysError("chdir(" + args.request->working_dir + ")");
    ReportChildFailure(report_fd, ErrorCode::SandboxSetupError);
  }

  execve(args.argv[0], args.argv.data(), args.envp.data());
  TbxReportSysError(std::string("execve(") + args.argv[0] + ")");
  ReportChildFailure(report_fd, ErrorCode::SandboxSetupError);
}


static void ForwardSignal(int signum) {
  if (global_child_pid > 0) kill(-global_child_pid, signum);
}


static int WaitForChild() {
  while (true) {
    // Wait for some process to exit. This includes reparented processes in our
    // PID namespace.
    int status;
    const pid_t pid = TEMP_FAILURE_RETRY(wait(&status));

    if (pid < 0) {
      // ECHILD should be impossible because we haven't yet seen
      // global_child_pid exit.
      return TbxReportSysError("wait");
    }

    PRINT_DEBUG("wait returned pid=%d, status=0x%02x", pid, status);

    // If this isn't our child's PID, there's nothing further to do; we've
    // successfully reaped a zombie.
    if (pid == global_child_pid) {
      return status;
    }
  }
}


static void SpawnChild(const Pid1Args &args) {
  PRINT_DEBUG("calling fork...");
  global_child_pid = fork();

  if (global_child_pid < 0) {
    TbxReportSysError("fork");
    ReportChildFailure(args.report_fd, ErrorCode::SandboxSetupError);
  } else if (global_child_pid == 0) {
    // Put the child into its own process group.
    if (setpgid(0, 0) < 0) {
      TbxReportSysError("setpgid");
      ReportChildFailure(args.report_fd, ErrorCode::SandboxSetupError);
    }
    ExecSandboxedCommand(args, !args.user_namespace);
  }
  PRINT_DEBUG("child started with PID %d", global_child_pid);
}


int Pid1Main(void *arg) {
  const Pid1Args &args = *static_cast<Pid1Args *>(arg);
  PRINT_DEBUG("Pid1Main started with pid = %d", getpid());

  if (getpid() != 1) {
    TbxReportGenericError("using PID namespaces, but we are not PID 1");
    ReportChildFailure(args.report_fd, ErrorCode::SandboxSetupError);
  }

  if (WaitPipe(args.pipe_from_parent) < 0) {
    _exit(EXIT_FAILURE);
  }

  // Start with default signal handlers and an empty signal mask.
  ClearSignalMask();

  if (SetupSelfDestruction(args.pipe_to_parent) < 0 ||
      (args.user_namespace && SetupUserNamespace(args) < 0) ||
      SetupMountNamespace() < 0 ||
      (args.policy->fake_hostname && SetupUtsNamespace() < 0) ||
      MountSandboxAndGoThere(args.sandbox_root) < 0 ||
      MountDev() < 0 ||
      MountProcAndTmp() < 0 ||
      MountAllMounts(args) < 0 ||
      ChangeRoot() < 0 ||
      (!args.policy->network_enabled && SetupNetworking() < 0)) {
    ReportChildFailure(args.report_fd, ErrorCode::SandboxSetupError);
  }

  SpawnChild(args);

  // Only the command writes to the output pipes.
  close(args.stdout_fd);
  close(args.stderr_fd);

  InstallSignalHandler(SIGTERM, ForwardSignal);
  const int status = WaitForChild();
  if (status < 0) {
    ReportChildFailure(args.report_fd, ErrorCode::SandboxSetupError);
  }

  ChildReport report = {};
  report.kind = kChildExited;
  report.wait_status = status;
  SendChildReport(args.report_fd, report);
  return 0;
}
