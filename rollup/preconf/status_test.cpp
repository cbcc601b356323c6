// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "status.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace rollup::preconf {

TEST_CASE("PreconfStatus to_string", "[rollup][preconf][status]") {
    CHECK(to_string(PreconfStatus::kWaiting) == "waiting");
    CHECK(to_string(PreconfStatus::kSuccess) == "success");
    CHECK(to_string(PreconfStatus::kFailed) == "failed");
    CHECK(to_string(PreconfStatus::kTimeout) == "timeout");
    CHECK(to_string(static_cast<PreconfStatus>(42)) == "unknown");
    CHECK_FALSE(is_terminal(PreconfStatus::kWaiting));
    CHECK(is_terminal(PreconfStatus::kTimeout));
}

TEST_CASE("PreconfStatusCell first writer wins", "[rollup][preconf][status]") {
    PreconfStatusCell cell;
    CHECK(cell.load() == PreconfStatus::kWaiting);

    SECTION("success then timeout") {
        CHECK(cell.transition(PreconfStatus::kWaiting, PreconfStatus::kSuccess));
        CHECK_FALSE(cell.transition(PreconfStatus::kWaiting, PreconfStatus::kTimeout));
        CHECK(cell.load() == PreconfStatus::kSuccess);
    }

    SECTION("timeout then failure") {
        CHECK(cell.transition(PreconfStatus::kWaiting, PreconfStatus::kTimeout));
        CHECK_FALSE(cell.transition(PreconfStatus::kWaiting, PreconfStatus::kFailed));
        CHECK(cell.load() == PreconfStatus::kTimeout);
    }

    SECTION("concurrent writers") {
        std::atomic_int winners{0};
        std::vector<std::thread> threads;
        for (int i{0}; i < 8; ++i) {
            threads.emplace_back([&, i]() {
                const auto target{i % 2 == 0 ? PreconfStatus::kSuccess : PreconfStatus::kTimeout};
                if (cell.transition(PreconfStatus::kWaiting, target)) {
                    ++winners;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        CHECK(winners == 1);
        CHECK(is_terminal(cell.load()));
    }
}

}  // namespace rollup::preconf
