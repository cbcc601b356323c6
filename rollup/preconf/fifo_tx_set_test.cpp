// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fifo_tx_set.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollup/test_util/sample_data.hpp>

namespace rollup::preconf {

using test_util::kSenderA;
using test_util::kSenderB;
using test_util::make_transaction;

static std::vector<evmc::bytes32> hashes(const Transactions& txs) {
    std::vector<evmc::bytes32> out;
    for (const auto& tx : txs) {
        out.push_back(tx->hash);
    }
    return out;
}

TEST_CASE("FifoTxSet keeps admission order", "[rollup][preconf][fifo_tx_set]") {
    CountingPreconfMetrics metrics;
    FifoTxSet registry{metrics};

    const auto b0{make_transaction(kSenderB, 0)};
    const auto a0{make_transaction(kSenderA, 0)};
    const auto a1{make_transaction(kSenderA, 1)};
    registry.add(kSenderB, b0);
    registry.add(kSenderA, a0);
    registry.add(kSenderA, a1);

    CHECK(registry.size() == 3);
    CHECK(hashes(registry.transactions()) == std::vector{b0->hash, a0->hash, a1->hash});
    CHECK(metrics.snapshot().pending == 3);

    SECTION("re-adding moves the entry to the tail") {
        registry.set_status(b0->hash, PreconfStatus::kTimeout);
        registry.add(kSenderB, b0);
        CHECK(registry.size() == 3);
        CHECK(hashes(registry.transactions()) == std::vector{a0->hash, a1->hash, b0->hash});
        CHECK(registry.status(b0->hash) == PreconfStatus::kWaiting);
        CHECK(metrics.snapshot().pending == 3);
    }

    SECTION("lookup") {
        CHECK(registry.contains(a0->hash));
        CHECK(registry.get(a1->hash) == a1);
        CHECK(registry.get(make_transaction(kSenderA, 7)->hash) == nullptr);
        CHECK_FALSE(registry.status(make_transaction(kSenderA, 7)->hash));
    }

    SECTION("status update of unknown hash") {
        CHECK_FALSE(registry.set_status(make_transaction(kSenderA, 7)->hash, PreconfStatus::kSuccess));
        CHECK(registry.set_status(a0->hash, PreconfStatus::kSuccess) == PreconfStatus::kSuccess);
        CHECK(registry.status(a0->hash) == PreconfStatus::kSuccess);
    }

    SECTION("remove") {
        registry.remove(a0->hash);
        registry.remove(a0->hash);
        CHECK(registry.size() == 2);
        CHECK(hashes(registry.transactions()) == std::vector{b0->hash, a1->hash});
        CHECK(metrics.snapshot().pending == 2);
    }

    SECTION("clear") {
        registry.clear();
        CHECK(registry.empty());
        CHECK(metrics.snapshot().pending == 0);
    }
}

TEST_CASE("FifoTxSet forward", "[rollup][preconf][fifo_tx_set]") {
    CountingPreconfMetrics metrics;
    FifoTxSet registry{metrics};

    const auto a1{make_transaction(kSenderA, 1)};
    const auto a2{make_transaction(kSenderA, 2)};
    const auto a3{make_transaction(kSenderA, 3)};
    const auto b1{make_transaction(kSenderB, 1)};
    registry.add(kSenderA, a1);
    registry.add(kSenderB, b1);
    registry.add(kSenderA, a2);
    registry.add(kSenderA, a3);

    registry.forward(kSenderA, 3);
    CHECK(hashes(registry.transactions()) == std::vector{b1->hash, a3->hash});
    CHECK(metrics.snapshot().pending == 2);
    CHECK(metrics.snapshot().timers[static_cast<size_t>(PreconfTimer::kTxPoolForward)].count == 1);

    registry.forward(kSenderA, 0);
    CHECK(registry.size() == 2);
}

TEST_CASE("FifoTxSet clean_timeout", "[rollup][preconf][fifo_tx_set]") {
    CountingPreconfMetrics metrics;
    FifoTxSet registry{metrics};

    const auto s{make_transaction(kSenderA, 0)};
    const auto t1{make_transaction(kSenderA, 1)};
    const auto f{make_transaction(kSenderA, 2)};
    const auto t2{make_transaction(kSenderA, 3)};
    for (const auto& tx : {s, t1, f, t2}) {
        registry.add(kSenderA, tx);
    }
    registry.set_status(s->hash, PreconfStatus::kSuccess);
    registry.set_status(t1->hash, PreconfStatus::kTimeout);
    registry.set_status(f->hash, PreconfStatus::kFailed);
    registry.set_status(t2->hash, PreconfStatus::kTimeout);

    const auto removed{registry.clean_timeout()};
    REQUIRE(removed.size() == 2);
    CHECK(removed[0].tx == t1);
    CHECK(removed[1].tx == t2);
    CHECK(removed[0].from == kSenderA);
    CHECK(hashes(registry.transactions()) == std::vector{s->hash, f->hash});
    CHECK(metrics.snapshot().pending == 2);

    CHECK(registry.clean_timeout().empty());
}

}  // namespace rollup::preconf
