// Copyright 2017 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/process-tools.h"

#include <gnu/libc-version.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>


FILE *global_debug = nullptr;
thread_local bool global_quiet = false;


int EnableDebugLog(const std::string &path) {
  if (global_debug != nullptr) {
    return TbxReportError(ErrorCode::LogFileNotUnique);
  }
  global_debug = fopen(path.c_str(), "a");
  if (global_debug == nullptr) {
    return TbxReportSysError("fopen(" + path + ")");
  }
  return 0;
}


void CloseDebugLog() {
  if (global_debug != nullptr) {
    fclose(global_debug);
    global_debug = nullptr;
  }
}


static void logOSKernel() {
  struct utsname buf;
  if (GetKernelInfo(&buf)) {
    PRINT_DEBUG("OS: %s", buf.sysname);
    PRINT_DEBUG("Kernel: %s", buf.release);
    PRINT_DEBUG("Version: %s", buf.version);
    PRINT_DEBUG("Machine: %s", buf.machine);
  } else {
    PRINT_DEBUG("uname failed: %s", strerror(errno));
  }
}


static void logOSName() {
  std::string pretty, version;
  if (!GetOSName(pretty, version)) {
    PRINT_DEBUG("Can't log OS info: /etc/os-release missing or keys not found");
    return;
  }
  PRINT_DEBUG("OS NAME: %s", pretty.empty() ? "<unknown>" : pretty.c_str());
  PRINT_DEBUG("OS VERSION_ID: %s",
              version.empty() ? "<unknown>" : version.c_str());
}


void logSystem() {
  if (global_debug == nullptr) return;

  logOSKernel();
  logOSName();
  PRINT_DEBUG("libc: %s", gnu_get_libc_version());
#ifdef _GLIBCXX_RELEASE
  PRINT_DEBUG("libstdc++ release: %d", _GLIBCXX_RELEASE);
#endif
  PRINT_DEBUG("harness uid=%d euid=%d gid=%d", getuid(), geteuid(), getgid());
}
