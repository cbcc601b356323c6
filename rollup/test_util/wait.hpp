// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <thread>

namespace rollup::test_util {

//! \brief Polls \p condition until it holds or \p timeout expires
//! \return the last evaluation of the condition
template <typename Condition>
bool wait_until(Condition&& condition, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
    const auto deadline{std::chrono::steady_clock::now() + timeout};
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return condition();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
}

}  // namespace rollup::test_util
