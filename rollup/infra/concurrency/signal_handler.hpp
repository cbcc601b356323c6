// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>

namespace rollup {

//! \brief Turns SIGINT and SIGTERM into a graceful shutdown request polled by the main loop
//! \details A second signal received while shutting down terminates the process immediately
class SignalHandler {
  public:
    static void init();

    static bool signalled() { return signalled_; }

  private:
    static void handle(int sig_code);

    static std::atomic_bool signalled_;
};

}  // namespace rollup
