// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#include <unistd.h>

namespace rollup {

static bool is_terminal_stream(FILE* stream) {
    return isatty(fileno(stream)) != 0;
}

bool is_terminal_stdout() {
    return is_terminal_stream(stdout);
}

bool is_terminal_stderr() {
    return is_terminal_stream(stderr);
}

}  // namespace rollup
