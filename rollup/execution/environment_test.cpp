// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollup/test_util/in_memory_state.hpp>
#include <rollup/test_util/sample_data.hpp>

namespace rollup::execution {

using test_util::InMemoryState;
using test_util::kSenderA;

TEST_CASE("GasPool", "[rollup][execution][environment]") {
    GasPool pool{50'000};
    CHECK(pool.sub_gas(21'000));
    CHECK(pool.gas() == 29'000);

    const auto exhausted{pool.sub_gas(30'000)};
    REQUIRE_FALSE(exhausted);
    CHECK(exhausted.error().code == preconf::ExecutionErrorCode::kGasLimitReached);
    CHECK(pool.gas() == 29'000);

    pool.add_gas(1'000);
    CHECK(pool.sub_gas(30'000));
    CHECK(pool.gas() == 0);
}

TEST_CASE("BuildEnvironment", "[rollup][execution][environment]") {
    CHECK_THROWS_AS(BuildEnvironment(BlockHeader{}, nullptr), std::logic_error);

    auto state{std::make_unique<InMemoryState>()};
    state->set_nonce(kSenderA, 3);
    BuildEnvironment env{BlockHeader{.number = 10, .gas_limit = 100'000}, std::move(state)};
    CHECK(env.gas_pool.gas() == 100'000);
    CHECK(env.tcount == 0);

    const auto tx{test_util::make_transaction(kSenderA, 3)};
    env.txs.push_back(tx);
    env.receipts.push_back(Receipt{.tx_hash = tx->hash, .success = true});
    env.checkpoints.push_back(AppliedTxCheckpoint{});
    env.tcount = 1;
    env.gas_pool.set_gas(79'000);

    SECTION("find_receipt") {
        const auto* receipt{env.find_receipt(tx->hash)};
        REQUIRE(receipt);
        CHECK(receipt->success);
        CHECK(env.find_receipt(test_util::make_transaction(kSenderA, 4)->hash) == nullptr);
    }

    SECTION("copy is independent and drops undo checkpoints") {
        auto copy{env.copy()};
        CHECK(copy.header == env.header);
        CHECK(copy.gas_pool.gas() == 79'000);
        CHECK(copy.tcount == 1);
        CHECK(copy.txs == env.txs);
        CHECK(copy.receipts == env.receipts);
        CHECK(copy.checkpoints.empty());

        auto* copied_state{dynamic_cast<InMemoryState*>(copy.state.get())};
        REQUIRE(copied_state);
        copied_state->set_nonce(kSenderA, 9);
        CHECK(dynamic_cast<InMemoryState*>(env.state.get())->nonce(kSenderA) == 3);
    }

    SECTION("reset_gas_pool") {
        env.reset_gas_pool();
        CHECK(env.gas_pool.gas() == 100'000);
    }
}

}  // namespace rollup::execution
