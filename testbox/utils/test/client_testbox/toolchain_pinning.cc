/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <assert.h>

#include <string>

#include "src/main/tools/error-handling.h"
#include "src/main/tools/toolchain-pinner.h"
#include "../test-utils.h"

// Installs a fake tool that reports `reported` as its version.
static std::string FakeInstaller(const std::string& reported) {
    return "mkdir -p {prefix}/bin && "
           "printf '#!/bin/sh\\necho {name} version v" + reported + "\\n' "
           "> {prefix}/bin/{name} && chmod +x {prefix}/bin/{name}";
}

int main() {
    std::string root = MakeTempDir("testbox-toolchains-");

    ToolchainSpec spec;
    spec.name = "faketool";
    spec.version = "1.4.2";
    spec.root = root;

    // Nothing installed and no way to install it.
    PinnedToolchain pinned;
    TbxClearError();
    assert(PinToolchain(spec, &pinned) < 0);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::ToolchainUnavailable));

    // A failing installer leaves no half-installed prefix behind.
    spec.install_command = "mkdir -p {prefix}/bin && exit 3";
    TbxClearError();
    assert(PinToolchain(spec, &pinned) < 0);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::ToolchainUnavailable));
    assert(access((root + "/faketool/1.4.2").c_str(), F_OK) != 0);

    // An installer that delivers another version is a mismatch, and the bad
    // install is removed.
    spec.install_command = FakeInstaller("1.4.3");
    TbxClearError();
    assert(PinToolchain(spec, &pinned) < 0);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::VersionMismatch));
    assert(access((root + "/faketool/1.4.2").c_str(), F_OK) != 0);

    // The right one.
    spec.install_command = FakeInstaller("1.4.2");
    TbxClearError();
    assert(PinToolchain(spec, &pinned) == 0);
    assert(pinned.verified_version == "1.4.2");
    assert(pinned.prefix == root + "/faketool/1.4.2");
    assert(pinned.bin_dir == pinned.prefix + "/bin");
    char link[4096];
    ssize_t n = readlink((root + "/faketool/current").c_str(), link, sizeof(link) - 1);
    assert(n > 0);
    link[n] = '\0';
    assert(std::string(link).find("1.4.2") != std::string::npos);

    // Already installed: no installer run, still verified.
    spec.install_command = "exit 1";
    assert(PinToolchain(spec, &pinned) == 0);

    // Something changed the installed tool behind our back.
    WriteTextFile(pinned.bin_dir + "/faketool", "#!/bin/sh\necho faketool 9.9.9\n");
    TbxClearError();
    assert(PinToolchain(spec, &pinned) < 0);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::VersionMismatch));

    // Never silently upgrades to a channel name.
    spec.version = "stable";
    TbxClearError();
    assert(PinToolchain(spec, &pinned) < 0);
    assert(TbxGetErrorCode() == static_cast<int>(ErrorCode::InvalidToolchainSpec));

    assert(ExpandToolchainTemplate("{name}-{version} from {source} to {prefix}",
                                   spec, "/p") == "faketool-stable from  to /p");

    RemoveDirectoryTree(root);
    printf("toolchain pinning ok\n");
    return 0;
}
