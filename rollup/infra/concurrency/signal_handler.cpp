// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "signal_handler.hpp"

#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace rollup {

std::atomic_bool SignalHandler::signalled_{false};

template <size_t N>
static void write_stderr(const char (&message)[N]) {
    // Only async-signal-safe calls here
    [[maybe_unused]] const auto written{::write(STDERR_FILENO, message, N - 1)};
}

void SignalHandler::init() {
    struct sigaction sa {};
    sa.sa_handler = &SignalHandler::handle;
    sigfillset(&sa.sa_mask);
    for (const int sig_code : {SIGINT, SIGTERM}) {
        if (::sigaction(sig_code, &sa, nullptr) == -1) {
            throw std::runtime_error("cannot install handler for signal " + std::to_string(sig_code));
        }
    }
}

void SignalHandler::handle(int /*sig_code*/) {
    if (signalled_.exchange(true)) {
        write_stderr("\nForced exit\n");
        std::_Exit(EXIT_FAILURE);
    }
    write_stderr("\nShutting down preconf monitor, interrupt again to force exit\n");
}

}  // namespace rollup
