/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <arpa/inet.h>
#include <libgen.h>
#include <netinet/in.h>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <assert.h>

#include <string>
#include <vector>

#include "../test-utils.h"

// Run inside the sandbox: exits 0 only if a datagram could be sent to an
// address off this host (192.0.2.1 is reserved for documentation).
static int SendOffHost() {
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        perror("socket");
        return 1;
    }
    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(9);
    inet_pton(AF_INET, "192.0.2.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("connect");
        close(fd);
        return 1;
    }
    if (send(fd, "x", 1, 0) < 0) {
        perror("send");
        close(fd);
        return 1;
    }
    close(fd);
    return 0;
}

static std::string SelfPath() {
    char buf[4096];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "";
    buf[n] = '\0';
    return buf;
}

// The system roots plus the directory of this binary, read-only.
static std::vector<std::string> ReadonlyArgs(const std::string& self) {
    std::vector<std::string> args;
    const char* roots[] = {"/bin", "/usr", "/lib", "/lib64", "/etc"};
    for (const char* r : roots) {
        if (access(r, F_OK) == 0) {
            args.push_back("-r");
            args.push_back(r);
        }
    }
    std::vector<char> copy(self.begin(), self.end());
    copy.push_back('\0');
    std::string dir = dirname(copy.data());
    if (dir.compare(0, 5, "/usr/") != 0) {
        args.push_back("-r");
        args.push_back(dir);
    }
    return args;
}

int main(int argc, char* argv[]) {
    if (argc > 1 && strcmp(argv[1], "send-off-host") == 0) {
        return SendOffHost();
    }

    SkipUnlessSandbox();
    std::string ws = MakeTempDir("testbox-net-");
    HandWorkspaceTo(ws, "nobody");
    std::string self = SelfPath();
    assert(!self.empty());

    // With the default policy the only interface left is loopback, and it is
    // up.
    nlohmann::json report;
    const std::string count_interfaces =
        "cat /proc/net/dev; test $(grep -c ':' /proc/net/dev) -eq 1 && "
        "grep -q 'lo:' /proc/net/dev";
    int code = RunHarness({"-W", ws, "-X", count_interfaces}, &report);
    assert(code == 0);

    // Sending to another host fails at the socket layer.
    std::vector<std::string> args = ReadonlyArgs(self);
    std::vector<std::string> denied = {"-W", ws};
    denied.insert(denied.end(), args.begin(), args.end());
    denied.push_back("-X");
    denied.push_back(ShellQuote(self) + " send-off-host");
    code = RunHarness(denied, &report);
    assert(code == 1);
    assert(report["test"]["stderr"].get<std::string>().find("connect") !=
           std::string::npos);

    // With -N the host's interfaces are visible.
    std::string host_dev = ReadTextFile("/proc/net/dev");
    int host_interfaces = 0;
    for (size_t pos = 0; (pos = host_dev.find(':', pos)) != std::string::npos; ++pos) {
        host_interfaces++;
    }
    if (host_interfaces > 1) {
        code = RunHarness({"-W", ws, "-N", "-X", count_interfaces}, &report);
        assert(code == 1);
    }

    // Best effort cannot take the network away, so it refuses to run.
    code = RunHarness({"-W", ws, "-x", "-X", "true"}, &report);
    assert(code == 7);
    assert(report["error"]["code"] == "SandboxSetupError");
    assert(report["test"]["executed"] == false);

    RemoveDirectoryTree(ws);
    printf("network denied ok\n");
    return 0;
}
