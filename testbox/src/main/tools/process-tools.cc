// Copyright 2015 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/process-tools.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/output-buffer.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <string>
#include <vector>

#define POLL_SLICE_MS 100

extern char **environ;

static std::atomic<bool> cancellation_requested(false);

void InstallSignalHandler(int signum, void (*handler)(int)) {
  struct sigaction sa = {};
  sa.sa_handler = handler;
  if (handler == SIG_IGN || handler == SIG_DFL) {
    // No point in blocking signals when using the default handler or ignoring
    // the signal.
    if (sigemptyset(&sa.sa_mask) < 0) {
      TbxReportSysError("sigemptyset");
    }
  } else {
    // When using a custom handler, block all signals from firing while the
    // handler is running.
    if (sigfillset(&sa.sa_mask) < 0) {
      TbxReportSysError("sigfillset");
    }
  }
  // sigaction may fail for certain reserved signals. Ignore failure in this
  // case, but report it in debug mode, just in case.
  if (sigaction(signum, &sa, nullptr) < 0) {
    PRINT_DEBUG("sigaction(%d, &sa, nullptr) failed", signum);
  }
}

void IgnoreSignal(int signum) {
  // These signals can't be handled, so we'll just not do anything for these.
  if (signum != SIGSTOP && signum != SIGKILL) {
    InstallSignalHandler(signum, SIG_IGN);
  }
}


// Only async-signal-safe calls: this runs between fork and exec.
void ClearSignalMask() {
  sigset_t empty_sset;
  sigemptyset(&empty_sset);
  sigprocmask(SIG_SETMASK, &empty_sset, nullptr);

  for (int i = 1; i < NSIG; ++i) {
    if (i == SIGKILL || i == SIGSTOP) {
      continue;
    }

    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    // Ignore possible errors, because we might not be allowed to set the
    // handler for certain signals, but we still want to try.
    sigaction(i, &sa, nullptr);
  }
}


int WriteFile(const std::string &filename, const char *fmt, ...) {
  FILE *stream = fopen(filename.c_str(), "w");
  if (stream == nullptr) {
    return -1;
  }

  va_list ap;
  va_start(ap, fmt);
  int r = vfprintf(stream, fmt, ap);
  va_end(ap);

  if (r < 0) {
    int saved_errno = errno;
    fclose(stream);
    errno = saved_errno;
    return -1;
  }

  if (fclose(stream) != 0) {
    return -1;
  }
  return 0;
}


int WriteFully(int fd, const void *buf, size_t len) {
  const char *p = static_cast<const char *>(buf);
  while (len > 0) {
    ssize_t n = write(fd, p, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    p += n;
    len -= static_cast<size_t>(n);
  }
  return 0;
}


int SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0) return -1;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}


// Waits for a signal to proceed from the pipe.
int WaitPipe(int *pipe) {
  char buf = 0;

  // Close the writer fd of this process as it should only be written to by the
  // writer of the other process.
  if (close(pipe[1]) < 0) {
    return -1;
  }
  ssize_t r;
  do {
    r = read(pipe[0], &buf, 1);
  } while (r < 0 && errno == EINTR);
  int saved_errno = errno;
  close(pipe[0]);
  if (r != 1) {
    errno = (r < 0) ? saved_errno : EPIPE;
    return -1;
  }
  return 0;
}


// Sends a signal to the pipe for the other waiting process proceed.
int SignalPipe(int *pipe) {
  char buf = 0;
  // Close the reader fd of this process as it should only be read by the reader
  // of the other process.
  if (close(pipe[0]) < 0) {
    return -1;
  }
  if (WriteFully(pipe[1], &buf, 1) < 0) {
    int saved_errno = errno;
    close(pipe[1]);
    errno = saved_errno;
    return -1;
  }
  return close(pipe[1]);
}


void KillAndWait(pid_t pid) {
  kill(pid, SIGKILL);
  while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
  }
}


void RequestCancellation() {
  cancellation_requested.store(true);
}

bool CancellationRequested() {
  return cancellation_requested.load();
}


int CreateDirectories(const std::string& base_path) {
  std::error_code ec;
  fs::create_directories(base_path, ec);
  if (ec) {
    return TbxReportGenericError(base_path + ": " + ec.message());
  }
  return 0;
}


std::string CreateTempDirectory(const std::string &base_path,
                                const std::string &prefix) {
  std::string tmpl = base_path + "/" + prefix + "XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    TbxReportSysError("mkdtemp(" + tmpl + ")");
    return "";
  }
  return std::string(buf.data());
}


static void makeWritable(const fs::path &dir, unsigned depth) {
  std::error_code ec;
  fs::permissions(dir,
                  fs::perms::owner_write | fs::perms::owner_exec |
                      fs::perms::owner_read
#ifdef _EXPERIMENTAL_FILESYSTEM_
                      | fs::perms::add_perms,
#else
                  ,
                  fs::perm_options::add,
#endif
                  ec);
  if (ec) {
    PRINT_DEBUG("Warning: error changing permissions for %s",
                dir.string().c_str());
  }
  if (depth > MAX_DEPTH_REMOVE_TREE)
    return;

  for (fs::directory_iterator it(
           dir, fs::directory_options::skip_permission_denied, ec), end;
       !ec && it != end; it.increment(ec)) {
    if (it->is_symlink(ec)) continue;
    if (it->is_directory(ec)) {
      makeWritable(it->path(), depth + 1);
    }
  }
}


int RemoveDirectoryTree(const std::string &path) {
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(path, ec))) {
    return 0;
  }
  if (fs::is_directory(fs::symlink_status(path, ec))) {
    makeWritable(path, 0);
  }
  fs::remove_all(path, ec);
  if (ec) {
    return TbxReportGenericError("remove " + path + ": " + ec.message());
  }
  PRINT_DEBUG("removed %s", path.c_str());
  return 0;
}


int GetCWD(std::string& res) {
  std::error_code ec;
  fs::path current = fs::current_path(ec);
  if (ec) {
    return TbxReportGenericError("getcwd: " + ec.message());
  }
  res = current.string();
  return 0;
}


void addIfNotPresent(std::vector<std::string> &paths, const std::string &path) {
  if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
    paths.push_back(path);
  }
}


std::string Trim(const std::string& s) {
  auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };
  auto begin = std::find_if(s.begin(), s.end(), is_not_space);
  auto end = std::find_if(s.rbegin(), s.rend(), is_not_space).base();
  if (begin >= end) return "";
  return std::string(begin, end);
}


std::vector<std::string> SplitString(const std::string& s, char delim) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t pos = s.find(delim, start);
    if (pos == std::string::npos) pos = s.size();
    std::string item = Trim(s.substr(start, pos - start));
    if (!item.empty()) out.push_back(item);
    start = pos + 1;
  }
  return out;
}


std::string ShellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}


// Remove surrounding single or double quotes if present
static inline void unquote(std::string& s) {
  if (s.size() >= 2 &&
      ((s.front() == '"' && s.back() == '"') ||
       (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

// Parses /etc/os-release and returns NAME and VERSION_ID via out-params.
// Returns true iff at least one of the requested keys was found.
bool GetOSName(std::string& printable_name, std::string& version_id) {
  printable_name.clear();
  version_id.clear();

  std::ifstream file("/etc/os-release");
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') continue;

    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) continue;

    std::string key = Trim(line.substr(0, eq_pos));
    std::string value = Trim(line.substr(eq_pos + 1));
    unquote(value);

    if (key == "NAME") {
      printable_name = value;
    } else if (key == "VERSION_ID") {
      version_id = value;
    }

    if (!printable_name.empty() && !version_id.empty()) {
      break;
    }
  }
  return (!printable_name.empty() || !version_id.empty());
}


bool GetKernelInfo(struct utsname* buf) {
  return (uname(buf) == 0);
}


int64_t MonotonicMillis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}


void ScopedFd::reset(int fd) {
  if (fd_ >= 0) {
    close(fd_);
  }
  fd_ = fd;
}


ScopedFileLock::~ScopedFileLock() {
  if (fd_.get() >= 0) {
    flock(fd_.get(), LOCK_UN);
  }
}


int ScopedFileLock::Acquire(const std::string& path) {
  fd_.reset(open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
  if (fd_.get() < 0) {
    return TbxReportSysError("open(" + path + ")");
  }
  while (flock(fd_.get(), LOCK_EX) < 0) {
    if (errno != EINTR) {
      return TbxReportSysError("flock(" + path + ")");
    }
  }
  PRINT_DEBUG("locked %s", path.c_str());
  return 0;
}


// Returns false once `child` is known to be gone.
static bool ReapIfExited(DrainChild* child) {
  if (child == nullptr || child->exited) return false;
  for (;;) {
    pid_t r = waitpid(child->pid, &child->status, WNOHANG);
    if (r == child->pid) {
      child->exited = true;
      return false;
    }
    if (r == 0) return true;
    if (errno == EINTR) continue;
    TbxReportSysError("waitpid(" + std::to_string(child->pid) + ")");
    return false;
  }
}


DrainResult DrainPipes(std::vector<DrainTarget>& targets, DrainChild* child,
                       int64_t deadline_ms, bool honour_cancellation) {
  char buf[16384];
  for (;;) {
    std::vector<struct pollfd> fds;
    std::vector<DrainTarget*> open_targets;
    for (DrainTarget& t : targets) {
      if (!t.eof) {
        fds.push_back({t.fd, POLLIN, 0});
        open_targets.push_back(&t);
      }
    }
    const bool running = ReapIfExited(child);
    if (child != nullptr && !running && !child->exited) return DRAIN_ERROR;
    if (fds.empty() && !running) return DRAIN_EOF;
    if (honour_cancellation && CancellationRequested()) return DRAIN_CANCELLED;

    int slice = POLL_SLICE_MS;
    if (deadline_ms >= 0) {
      int64_t left = deadline_ms - MonotonicMillis();
      if (left <= 0) return DRAIN_DEADLINE;
      slice = static_cast<int>(std::min<int64_t>(left, POLL_SLICE_MS));
    }

    // With every pipe closed this only sleeps until the next exit check.
    int r = poll(fds.data(), fds.size(), slice);
    if (r < 0) {
      if (errno == EINTR) continue;
      TbxReportSysError("poll");
      return DRAIN_ERROR;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].revents == 0) continue;
      DrainTarget* t = open_targets[i];
      for (;;) {
        ssize_t n = read(t->fd, buf, sizeof(buf));
        if (n > 0) {
          if (t->sink != nullptr) t->sink->Append(buf, static_cast<size_t>(n));
          continue;
        }
        if (n == 0) {
          t->eof = true;
        } else if (errno == EINTR) {
          continue;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
          PRINT_DEBUG("read(%d) failed: %s", t->fd, strerror(errno));
          t->eof = true;
        }
        break;
      }
    }
  }
}


int WaitForChild(DrainChild* child) {
  while (!child->exited) {
    if (waitpid(child->pid, &child->status, 0) == child->pid) {
      child->exited = true;
    } else if (errno != EINTR) {
      return TbxReportSysError("waitpid(" + std::to_string(child->pid) + ")");
    }
  }
  return 0;
}


// Looks `name` up in the colon-separated `path`, the way execvp would, but
// against the PATH the command will run with.
static std::string ResolveExecutable(const std::string& name,
                                     const std::string& path) {
  if (name.find('/') != std::string::npos) return name;
  for (const std::string& dir : SplitString(path, ':')) {
    std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) return candidate;
  }
  return "";
}


static std::string LookupEnv(const std::vector<std::string>& env,
                             const std::string& key) {
  const std::string prefix = key + "=";
  for (const std::string& kv : env) {
    if (kv.compare(0, prefix.size(), prefix) == 0) {
      return kv.substr(prefix.size());
    }
  }
  return "";
}


int RunCommand(const std::vector<std::string>& argv,
               const std::vector<std::string>& env, const std::string& cwd,
               int timeout_secs, CommandResult* result) {
  if (argv.empty()) {
    return TbxReportErrorAndMessage("empty command line",
                                    ErrorCode::IllegalConfiguration);
  }

  std::string path_value;
  if (env.empty()) {
    const char* p = getenv("PATH");
    path_value = p ? p : "/usr/bin:/bin";
  } else {
    path_value = LookupEnv(env, "PATH");
  }
  const std::string exe = ResolveExecutable(argv[0], path_value);
  if (exe.empty()) {
    return TbxReportGenericError(argv[0] + ": command not found in PATH");
  }

  // Everything the child needs is prepared before fork.
  std::vector<char*> c_argv;
  for (const std::string& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
  c_argv.push_back(nullptr);
  std::vector<char*> c_env;
  for (const std::string& e : env) c_env.push_back(const_cast<char*>(e.c_str()));
  c_env.push_back(nullptr);
  char* const* envp = env.empty() ? environ : c_env.data();

  int out_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) < 0) {
    return TbxReportSysError("pipe2");
  }

  PRINT_DEBUG("running %s (cwd %s)", exe.c_str(), cwd.c_str());
  const int64_t start = MonotonicMillis();
  pid_t pid = fork();
  if (pid < 0) {
    int saved_errno = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    errno = saved_errno;
    return TbxReportSysError("fork");
  }

  if (pid == 0) {
    setpgid(0, 0);
    ClearSignalMask();
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
        dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        dup2(out_pipe[1], STDERR_FILENO) < 0) {
      _exit(127);
    }
    if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
      dprintf(STDERR_FILENO, "chdir(%s): %s\n", cwd.c_str(), strerror(errno));
      _exit(127);
    }
    execve(exe.c_str(), c_argv.data(), envp);
    dprintf(STDERR_FILENO, "execve(%s): %s\n", exe.c_str(), strerror(errno));
    _exit(127);
  }

  close(out_pipe[1]);
  ScopedFd reader(out_pipe[0]);
  SetNonBlocking(reader.get());

  OutputBuffer output;
  std::vector<DrainTarget> targets = {{reader.get(), &output, false}};
  DrainChild child = {pid, 0, false};
  const int64_t deadline =
      timeout_secs > 0 ? start + static_cast<int64_t>(timeout_secs) * 1000 : -1;
  DrainResult drained = DrainPipes(targets, &child, deadline, true);
  if (drained != DRAIN_EOF) {
    PRINT_DEBUG("%s did not finish in time, killing it", exe.c_str());
    result->timed_out = (drained == DRAIN_DEADLINE);
    kill(-pid, SIGKILL);
    DrainPipes(targets, nullptr, MonotonicMillis() + 2000, false);
  }

  if (WaitForChild(&child) < 0) {
    return UNRECOVERABLE_FAIL;
  }
  const int status = child.status;

  result->output = output.Contents();
  if (WIFEXITED(status)) {
    result->exit_code = WEXITSTATUS(status);
    result->signal = 0;
  } else if (WIFSIGNALED(status)) {
    result->exit_code = 128 + WTERMSIG(status);
    result->signal = WTERMSIG(status);
  }
  PRINT_DEBUG("%s finished: exit=%d signal=%d", exe.c_str(), result->exit_code,
              result->signal);
  return 0;
}
