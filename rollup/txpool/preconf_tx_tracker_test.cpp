// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_tx_tracker.hpp"

#include <boost/signals2/connection.hpp>
#include <catch2/catch_test_macros.hpp>

#include <rollup/infra/test_util/log.hpp>
#include <rollup/infra/common/directories.hpp>
#include <rollup/test_util/event_recorder.hpp>
#include <rollup/test_util/memory_tx_pool.hpp>
#include <rollup/test_util/sample_data.hpp>
#include <rollup/test_util/wait.hpp>

namespace rollup::txpool {

using namespace std::chrono_literals;
using preconf::PreconfRequestPtr;
using preconf::PreconfStatus;
using test_util::kRecipient;
using test_util::kSenderA;
using test_util::kSenderB;
using test_util::make_transaction;
using test_util::wait_until;

static std::vector<evmc::bytes32> journaled_hashes(const std::filesystem::path& path) {
    TxJournal journal{path};
    std::vector<evmc::bytes32> hashes;
    journal.load([&](const Transactions& txs) {
        for (const auto& tx : txs) {
            hashes.push_back(tx->hash);
        }
    });
    return hashes;
}

TEST_CASE("PreconfTxTracker", "[rollup][txpool][preconf_tx_tracker]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto journal_path{tmp_dir.path() / "preconf_transactions.rlp"};

    test_util::MemoryTxPool pool;
    preconf::CountingPreconfMetrics metrics;
    PreconfTxPool preconf_pool{preconf::TxPoolConfig{.from_preconfs = {kSenderA}, .to_preconfs = {kRecipient}},
                               pool, metrics};
    std::vector<PreconfRequestPtr> requests;
    boost::signals2::scoped_connection request_connection{preconf_pool.signal_preconf_request.connect(
        [&](const PreconfRequestPtr& request) { requests.push_back(request); })};
    test_util::EventRecorder recorder{preconf_pool};

    const auto a0{make_transaction(kSenderA, 0)};
    const auto a1{make_transaction(kSenderA, 1)};
    const auto b0{make_transaction(kSenderB, 0)};

    SECTION("disabled journal") {
        PreconfTxTracker tracker{JournalSettings{}, preconf_pool, metrics};
        tracker.start();
        CHECK(wait_until([&] { return tracker.state() == Worker::State::kStopped; }));
        CHECK(pool.size() == 0);
        CHECK_FALSE(std::filesystem::exists(journal_path));
    }

    SECTION("restart restores the journaled transactions") {
        {
            TxJournal journal{journal_path};
            journal.rotate({a0, b0});
        }
        PreconfTxTracker tracker{JournalSettings{.path = journal_path}, preconf_pool, metrics};
        tracker.start();

        // Only successful preconfirmations survive the first rotation
        REQUIRE(wait_until([&] {
            return tracker.size() == 1 && pool.size() == 2 && tracker.state() == Worker::State::kKickWaiting;
        }));
        CHECK(pool.local_count() == 2);
        CHECK(preconf_pool.registry().status(a0->hash) == PreconfStatus::kSuccess);
        CHECK_FALSE(preconf_pool.registry().contains(b0->hash));
        CHECK(requests.empty());
        CHECK(wait_until([&] { return journaled_hashes(journal_path) == std::vector{a0->hash}; }));

        preconf_pool.preconf_ready();
        preconf_pool.add({a1}, /*local=*/false);
        REQUIRE(requests.size() == 1);

        SECTION("successful preconfirmation is journaled") {
            preconf_pool.set_preconf_tx_status(a1->hash, PreconfStatus::kSuccess);
            CHECK(requests[0]->completion.complete({.receipt = Receipt{.tx_hash = a1->hash, .success = true}}));
            CHECK(wait_until([&] { return tracker.size() == 2; }));
            CHECK(metrics.snapshot().journal_size == 2);

            tracker.stop(/*wait=*/true);
            CHECK(journaled_hashes(journal_path) == std::vector{a0->hash, a1->hash});
        }

        SECTION("failed preconfirmation is not journaled") {
            CHECK(requests[0]->completion.complete({.receipt = Receipt{.tx_hash = a1->hash, .success = false}}));
            REQUIRE(recorder.wait_for(1).size() == 1);

            tracker.stop(/*wait=*/true);
            CHECK(tracker.size() == 1);
            CHECK(journaled_hashes(journal_path) == std::vector{a0->hash});
        }
    }

    SECTION("tracking without an open journal") {
        PreconfTxTracker tracker{JournalSettings{.path = journal_path}, preconf_pool, metrics};
        tracker.track(a0);
        tracker.track_all({a0, a1}, /*clean=*/false);
        CHECK(tracker.size() == 2);
        tracker.track_all({b0}, /*clean=*/true);
        CHECK(tracker.size() == 1);
        CHECK(metrics.snapshot().journal_size == 1);
    }
}

}  // namespace rollup::txpool
