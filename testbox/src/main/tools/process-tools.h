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

#ifndef SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
#define SRC_MAIN_TOOLS_PROCESS_TOOLS_H_

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>
#include <time.h>
#include <string>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#define _EXPERIMENTAL_FILESYSTEM_
#endif

class OutputBuffer;

#define MAX_DEPTH_REMOVE_TREE 16

// Set up a signal handler for a signal.
void InstallSignalHandler(int signum, void (*handler)(int));

// Set the signal handler for `signum` to SIG_IGN (ignore).
void IgnoreSignal(int signum);

// Use an empty signal mask for the process and set all signal handlers to their
// default.
void ClearSignalMask();

// Write contents to a file. Returns 0 on success, -1 with errno set otherwise.
int WriteFile(const std::string &filename, const char *fmt, ...);

// Writes all of `buf`, retrying on EINTR and short writes.
int WriteFully(int fd, const void *buf, size_t len);

int SetNonBlocking(int fd);

// Blocks and waits on a pipe for the a signal to proceed from the other process
// `SignalPipe()`.
int WaitPipe(int *pipe);

// Signals to the other process blocked with a read `WaitPipe()` on the pipe
// that it can proceed by writing a byte to the pipe.
int SignalPipe(int *pipe);

void KillAndWait(pid_t pid);

// Async-signal-safe. Asks every run in the process to stop: wait loops in
// flight terminate their child as if the deadline had expired, and later
// ones do so right away. There is no way back, the request is meant for a
// harness that is shutting down.
void RequestCancellation();
bool CancellationRequested();

// Returns a fresh directory `<base_path>/<prefix>XXXXXX`, or an empty string
// with the last error set.
std::string CreateTempDirectory(const std::string& base_path,
                                const std::string& prefix);
int CreateDirectories(const std::string& base_path);

// Removes `path` recursively, first making directories writable so that
// read-only trees left behind by an installer can be deleted too.
int RemoveDirectoryTree(const std::string& path);

int GetCWD(std::string& res);

void addIfNotPresent(std::vector<std::string>& paths, const std::string& path);
std::string Trim(const std::string& s);
std::vector<std::string> SplitString(const std::string& s, char delim);

// Quotes `s` as one word for /bin/sh.
std::string ShellQuote(const std::string& s);

bool GetOSName(std::string& printable_name, std::string& version_id);
bool GetKernelInfo(struct utsname* buf);

int64_t MonotonicMillis();

// Owns a file descriptor and closes it on destruction.
class ScopedFd {
 public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {}
  ~ScopedFd() { reset(); }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const { return fd_; }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void reset(int fd = -1);

 private:
  int fd_;
};

// Exclusive advisory lock on a lock file, held until destruction.
class ScopedFileLock {
 public:
  ScopedFileLock() {}
  ~ScopedFileLock();
  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  // Blocks until the lock is held. Creates the lock file if needed.
  int Acquire(const std::string& path);

 private:
  ScopedFd fd_;
};

// One output pipe of a child and where its bytes go.
struct DrainTarget {
  int fd;
  OutputBuffer* sink;
  bool eof;
};

enum DrainResult {
  DRAIN_EOF,
  DRAIN_DEADLINE,
  DRAIN_CANCELLED,
  DRAIN_ERROR
};

// The process whose output is drained. Its exit is part of what DrainPipes
// waits for, since closing the pipes does not end it.
struct DrainChild {
  pid_t pid;
  int status;
  bool exited;
};

// Reads the non-blocking `targets` until every one reaches end of file and
// `child`, if given, has been reaped, the monotonic deadline `deadline_ms`
// passes (-1 means none) or cancellation is requested. Polls in short slices
// so that neither of the latter is missed.
DrainResult DrainPipes(std::vector<DrainTarget>& targets, DrainChild* child,
                       int64_t deadline_ms, bool honour_cancellation);

// Blocks until `child` is reaped, unless DrainPipes already did.
int WaitForChild(DrainChild* child);

struct CommandResult {
  int exit_code = -1;
  int signal = 0;
  bool timed_out = false;
  // stdout and stderr, interleaved.
  std::string output;
};

// Runs a trusted host command (the toolchain installer, git) outside of any
// sandbox. `argv[0]` is looked up in the PATH of `env`; an empty `env`
// inherits the harness environment. Returns 0 once the command has been
// waited for, whatever its exit status, and a negative value if it could not
// be started.
int RunCommand(const std::vector<std::string>& argv,
               const std::vector<std::string>& env, const std::string& cwd,
               int timeout_secs, CommandResult* result);

#endif  // SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
