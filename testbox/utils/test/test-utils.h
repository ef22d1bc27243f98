/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#ifndef TESTBOX_UTILS_TEST_TEST_UTILS_H_
#define TESTBOX_UTILS_TEST_TEST_UTILS_H_

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "src/main/tools/isolation-support.h"
#include "src/main/tools/privilege-dropper.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/sandbox.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/testbox-api.h"

// Exit code CTest reports as a skipped test.
#define SKIP_TEST 77

static inline std::string MakeTempDir(const char* prefix) {
    std::string dir = CreateTempDirectory("/tmp", prefix);
    if (dir.empty()) {
        printf("could not create a temporary directory\n");
        exit(EXIT_FAILURE);
    }
    chmod(dir.c_str(), 0755);
    return dir;
}

static inline void WriteTextFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

static inline std::string ReadTextFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static inline bool HaveGit() {
    return system("git --version >/dev/null 2>&1") == 0;
}

static inline bool HaveNobody() {
    TargetIdentity target;
    return ResolveTargetUser("nobody", "", &target) == 0;
}

// Network off, the usual system directories read-only, running as nobody.
static inline SandboxPolicy SystemRootsPolicy() {
    SandboxPolicy policy;
    const char* roots[] = {"/bin", "/usr", "/lib", "/lib64", "/etc"};
    for (const char* r : roots) {
        if (access(r, F_OK) == 0) policy.readonly_paths.push_back(r);
    }
    return policy;
}

// Namespaces the harness needs for a run with the network disabled, and a
// host that lets us mount proc and tmpfs inside them (some containers do not).
static inline bool SandboxAvailable() {
    if (!HaveNobody()) return false;
    if (!CanCreateNamespaces(NamespaceCloneFlags(false, geteuid() == 0))) {
        return false;
    }
    std::string dir = CreateTempDirectory("/tmp", "testbox-probe-");
    if (dir.empty()) return false;
    chmod(dir.c_str(), 0777);

    TargetIdentity target;
    ResolveTargetUser("nobody", "", &target);
    SandboxPolicy policy = SystemRootsPolicy();
    ExecutionRequest request;
    request.command = "true";
    request.working_dir = dir;
    request.env = {"PATH=/usr/bin:/bin"};
    ExecutionResult result;
    int rc = LaunchSandboxed(policy, target, request, &result);
    if (rc < 0) printf("sandbox probe failed: %s\n", TbxGetErrorMsg());
    RemoveDirectoryTree(dir);
    return rc == 0 && result.exit_code == 0;
}

static inline void SkipUnlessSandbox() {
    if (!SandboxAvailable()) {
        printf("namespaces unavailable on this host, skipping: %s\n",
               NamespaceSupportHint().c_str());
        exit(SKIP_TEST);
    }
}

// Running as root the commands become nobody, who must be able to write the
// workspace. In a user namespace nobody is mapped onto the caller already.
static inline void HandWorkspaceTo(const std::string& dir, const char* user) {
    if (geteuid() != 0) return;
    TargetIdentity target;
    if (ResolveTargetUser(user, "", &target) != 0) return;
    if (lchown(dir.c_str(), target.uid, target.gid) < 0) perror("lchown");
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (lchown(it->path().c_str(), target.uid, target.gid) < 0) {
            perror("lchown");
        }
    }
}

// Runs the harness through the library API with a minimal environment and
// returns the exit code. The parsed report lands in `report`.
static inline int RunHarness(std::vector<std::string> args, nlohmann::json* report,
                             std::vector<std::string> env = {}) {
    env.push_back("PATH=/usr/local/bin:/usr/bin:/bin");
    args.insert(args.begin(), "-q");
    std::string json_text;
    int code = testbox_run_with_env(args, env, &json_text);
    printf("testbox exit code %d\n%s\n", code, json_text.c_str());
    *report = json_text.empty() ? nlohmann::json() : nlohmann::json::parse(json_text);
    return code;
}

static inline std::string RunGitIn(const std::string& dir, const std::string& args) {
    std::string cmd = "git -c safe.directory='*' -C '" + dir + "' " + args + " 2>/dev/null";
    std::string out;
    FILE* p = popen(cmd.c_str(), "r");
    if (p == nullptr) return out;
    char buf[512];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), p)) > 0) out.append(buf, n);
    pclose(p);
    return Trim(out);
}

static inline void InitGitRepo(const std::string& dir) {
    std::string cmd = "cd '" + dir + "' && git init -q . && "
                      "git -c user.name=seed -c user.email=seed@example.com "
                      "commit -q --allow-empty -m seed";
    if (system(cmd.c_str()) != 0) {
        printf("git init failed in %s\n", dir.c_str());
        exit(EXIT_FAILURE);
    }
}

#endif  // TESTBOX_UTILS_TEST_TEST_UTILS_H_
