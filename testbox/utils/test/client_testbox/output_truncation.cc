/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <string.h>
#include <assert.h>

#include <algorithm>
#include <string>

#include "src/main/tools/output-buffer.h"

int main() {
    OutputBuffer small(64);
    small.Append("hello\n", 6);
    assert(!small.truncated());
    assert(small.Contents() == "hello\n");

    // 1000 bytes through a 100 byte buffer: 50 head, 50 tail, 900 dropped.
    OutputBuffer buf(100);
    std::string input;
    for (int i = 0; i < 1000; i++) input.push_back('a' + (i % 26));
    for (size_t off = 0; off < input.size(); off += 7) {
        size_t n = std::min<size_t>(7, input.size() - off);
        buf.Append(input.data() + off, n);
    }
    assert(buf.truncated());
    assert(buf.total() == 1000);
    assert(buf.dropped() == 900);

    std::string out = buf.Contents();
    assert(out.compare(0, 50, input, 0, 50) == 0);
    assert(out.compare(out.size() - 50, 50, input, 950, 50) == 0);
    assert(out.find("900 bytes omitted") != std::string::npos);

    // Exactly at the limit nothing is lost.
    OutputBuffer exact(10);
    exact.Append("0123456789", 10);
    assert(!exact.truncated());
    assert(exact.Contents() == "0123456789");
    exact.Append("x", 1);
    assert(exact.truncated());
    assert(exact.dropped() == 1);

    printf("output truncation ok\n");
    return 0;
}
