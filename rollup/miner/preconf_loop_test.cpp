// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_loop.hpp"

#include <random>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <rollup/infra/test_util/log.hpp>
#include <rollup/miner/block_filler.hpp>
#include <rollup/test_util/event_recorder.hpp>
#include <rollup/test_util/in_memory_state.hpp>
#include <rollup/test_util/memory_tx_pool.hpp>
#include <rollup/test_util/mock_sources.hpp>
#include <rollup/test_util/sample_data.hpp>
#include <rollup/test_util/test_processor.hpp>

namespace rollup::miner {

using namespace std::chrono_literals;
using namespace evmc::literals;
using preconf::PreconfStatus;
using test_util::kRecipient;
using test_util::kSenderA;
using test_util::kSenderB;
using test_util::make_environment;
using test_util::make_sync_status;
using test_util::make_transaction;
using test_util::unix_now;

static constexpr BlockNum kL2Block{50};

struct PreconfLoopTest {
    explicit PreconfLoopTest(preconf::TxPoolConfig pool_config) : preconf_pool{std::move(pool_config), pool, metrics} {}

    //! Makes the checker able to execute against the block after \p number
    void lend_environment(BlockNum number) {
        checker.update_sync_status(make_sync_status(100, kL2Block, unix_now()));
        auto env{make_environment(number)};
        auto& state{dynamic_cast<test_util::InMemoryState&>(*env.state)};
        state.set_nonce(kSenderA, 1);
        state.set_nonce(kSenderB, 1);
        checker.unpause_preconf(std::move(env), nullptr);
    }

    test_util::MemoryTxPool pool;
    preconf::CountingPreconfMetrics metrics;
    txpool::PreconfTxPool preconf_pool;
    test_util::TestProcessor processor;
    testing::NiceMock<test_util::MockL1LogSource> log_source;
    PreconfChecker checker{preconf::MinerConfig{}, processor, log_source, metrics};
    PreconfLoop loop{checker, preconf_pool};
    test_util::EventRecorder recorder{preconf_pool};
};

static preconf::TxPoolConfig all_preconfs(std::chrono::milliseconds timeout) {
    return preconf::TxPoolConfig{.all_preconfs = true, .preconf_timeout = timeout};
}

TEST_CASE("PreconfLoop process", "[rollup][miner][preconf_loop]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    PreconfLoopTest test{all_preconfs(5s)};
    test.lend_environment(kL2Block);

    boost::asio::io_context ioc;
    const auto a1{make_transaction(kSenderA, 1)};
    auto [request, channel] = preconf::make_preconf_request(a1, ioc.get_executor());

    SECTION("successful execution") {
        test.loop.process(request);
        CHECK(request->status->load() == PreconfStatus::kSuccess);
        CHECK(request->completion.is_spent());
        const auto result{channel->receive_for(0ms)};
        REQUIRE(result);
        REQUIRE(result->receipt);
        CHECK(result->receipt->success);
        CHECK(result->receipt->block_num == kL2Block + 1);
        CHECK_FALSE(result->error);
    }

    SECTION("reverted execution") {
        const auto reverting{make_transaction(kSenderA, 1, kRecipient, kTxGas, Bytes{test_util::kRevertMarker})};
        auto reverting_request{preconf::make_preconf_request(reverting, ioc.get_executor())};
        test.loop.process(reverting_request.first);
        CHECK(reverting_request.first->status->load() == PreconfStatus::kFailed);
        const auto result{reverting_request.second->receive_for(0ms)};
        REQUIRE(result);
        REQUIRE(result->receipt);
        CHECK_FALSE(result->receipt->success);
    }

    SECTION("execution error") {
        auto gap_request{preconf::make_preconf_request(make_transaction(kSenderA, 3), ioc.get_executor())};
        test.loop.process(gap_request.first);
        CHECK(gap_request.first->status->load() == PreconfStatus::kFailed);
        const auto result{gap_request.second->receive_for(0ms)};
        REQUIRE(result);
        CHECK_FALSE(result->receipt);
        REQUIRE(result->error);
        CHECK(std::get<preconf::ExecutionError>(*result->error).code == preconf::ExecutionErrorCode::kNonceTooHigh);
    }

    SECTION("request already timed out") {
        REQUIRE(request->status->transition(PreconfStatus::kWaiting, PreconfStatus::kTimeout));
        test.loop.process(request);
        CHECK(channel->is_closed());
        CHECK_FALSE(channel->receive_for(0ms));
        CHECK(test.processor.apply_count() == 0);
    }

    SECTION("gate closed") {
        REQUIRE(test.checker.release_environment());
        test.loop.process(request);
        CHECK(request->status->load() == PreconfStatus::kWaiting);
        CHECK(channel->is_closed());
        CHECK_FALSE(channel->receive_for(0ms));
    }

    SECTION("timeout during execution reverts the transaction") {
        test.processor.set_delay(200ms);
        const auto status{request->status};
        std::thread timer{[status]() {
            std::this_thread::sleep_for(50ms);
            status->transition(PreconfStatus::kWaiting, PreconfStatus::kTimeout);
        }};
        test.loop.process(request);
        timer.join();
        CHECK(request->status->load() == PreconfStatus::kTimeout);
        CHECK(channel->is_closed());
        CHECK_FALSE(channel->receive_for(0ms));
        const auto env{test.checker.release_environment()};
        REQUIRE(env);
        CHECK(env->txs.empty());
    }
}

TEST_CASE("PreconfLoop races the intake timeout", "[rollup][miner][preconf_loop]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::mt19937 rng{42};
    std::uniform_int_distribution<int> execution_delay_ms{0, 40};
    constexpr auto kTimeout{20ms};

    for (int i{0}; i < 25; ++i) {
        PreconfLoopTest test{all_preconfs(kTimeout)};
        test.lend_environment(kL2Block);
        test.preconf_pool.preconf_ready();
        test.processor.set_delay(std::chrono::milliseconds{execution_delay_ms(rng)});
        test.loop.start();

        const auto a1{make_transaction(kSenderA, 1)};
        test.preconf_pool.add({a1}, /*local=*/false);
        REQUIRE(test.recorder.wait_for(1).size() == 1);
        test.loop.stop(/*wait=*/true);
        std::this_thread::sleep_for(2 * kTimeout);

        // Exactly one verdict, consistent with the registry and the executed environment
        const auto events{test.recorder.events()};
        REQUIRE(events.size() == 1);
        CHECK(events[0].tx_hash == a1->hash);
        const auto registry_status{test.preconf_pool.registry().status(a1->hash)};
        const auto env{test.checker.release_environment()};
        REQUIRE(env);
        if (events[0].status == PreconfStatus::kSuccess) {
            CHECK(registry_status == PreconfStatus::kSuccess);
            CHECK(env->txs == Transactions{a1});
        } else {
            CHECK(events[0].status == PreconfStatus::kTimeout);
            CHECK(registry_status == PreconfStatus::kTimeout);
            CHECK(env->txs.empty());
        }
    }
}

TEST_CASE("PreconfLoop serves the intake", "[rollup][miner][preconf_loop]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    PreconfLoopTest test{all_preconfs(400ms)};
    BlockFiller filler{test.checker, test.preconf_pool, test.pool, test.processor};

    // Two deposits are waiting in the L1 blocks not derived yet
    const evmc::bytes32 l1_block_hash{0x00000000000000000000000000000000000000000000000000000000000000bb_bytes32};
    ON_CALL(test.log_source, filter_logs(testing::_))
        .WillByDefault(testing::Return(Logs{
            test_util::make_deposit_log(l1_block_hash, 0, test_util::kDepositor, kRecipient, 100'000),
            test_util::make_deposit_log(l1_block_hash, 1, test_util::kDepositor, kRecipient, 100'000),
        }));
    auto status{make_sync_status(100, kL2Block, unix_now())};
    status.head_l1.number = 102;
    test.checker.update_sync_status(status);
    const auto deposits{test.checker.deposit_txs()};
    REQUIRE(deposits.size() == 2);

    // First building cycle: nothing to fill, preconfirmation starts afterwards
    auto env{make_environment(kL2Block)};
    auto& state{dynamic_cast<test_util::InMemoryState&>(*env.state)};
    state.set_nonce(kSenderA, 1);
    state.set_nonce(kSenderB, 1);
    const auto first_fill{filler.fill_transactions(env)};
    CHECK(first_fill.sealed_preconf_txs.empty());
    REQUIRE(test.preconf_pool.is_preconf_ready());
    test.loop.start();

    const auto a1{make_transaction(kSenderA, 1)};
    const auto b1{make_transaction(kSenderB, 1)};
    const auto a2{make_transaction(kSenderA, 2)};
    test.preconf_pool.add({a1, b1, a2}, /*local=*/false);

    SECTION("preconfirmed transactions are sealed in admission order") {
        const auto events{test.recorder.wait_for(3)};
        REQUIRE(events.size() == 3);
        CHECK(events[0].tx_hash == a1->hash);
        CHECK(events[1].tx_hash == b1->hash);
        CHECK(events[2].tx_hash == a2->hash);
        for (const auto& event : events) {
            CHECK(event.status == PreconfStatus::kSuccess);
            CHECK(event.predicted_l2_block_number == kL2Block + 1);
        }
        CHECK(test.preconf_pool.preconf_txs(PreconfStatus::kSuccess) == Transactions{a1, b1, a2});
        CHECK(test.metrics.snapshot().success == 3);

        // Next building cycle seals them after the deposits the builder applies first
        auto next_env{make_environment(kL2Block + 1)};
        auto& next_state{dynamic_cast<test_util::InMemoryState&>(*next_env.state)};
        next_state.set_nonce(kSenderA, 1);
        next_state.set_nonce(kSenderB, 1);
        for (const auto& deposit : deposits) {
            REQUIRE(execution::commit_transaction(test.processor, next_env, deposit));
        }
        const auto fill{filler.fill_transactions(next_env)};
        CHECK(fill.sealed_preconf_txs == Transactions{a1, b1, a2});
        CHECK(fill.unsealed_preconf_txs.empty());
        CHECK(next_env.txs == Transactions{deposits[0], deposits[1], a1, b1, a2});
        CHECK(test.preconf_pool.registry().empty());
        CHECK(test.checker.env_block_number() == kL2Block + 2);
    }

    SECTION("closed gate turns into timeouts") {
        REQUIRE(test.recorder.wait_for(3).size() == 3);
        // Preconfirmations were executed after the deposits
        const auto preconf_env{test.checker.release_environment()};
        REQUIRE(preconf_env);
        CHECK(preconf_env->txs == Transactions{deposits[0], deposits[1], a1, b1, a2});
        const auto c0{make_transaction(test_util::kSenderC, 0)};
        test.preconf_pool.add({c0}, /*local=*/false);
        const auto events{test.recorder.wait_for(4)};
        REQUIRE(events.size() == 4);
        const auto& last{events.back()};
        CHECK(last.tx_hash == c0->hash);
        CHECK(last.status == PreconfStatus::kTimeout);
        CHECK(test.preconf_pool.registry().status(c0->hash) == PreconfStatus::kTimeout);

        // Timed out transactions are retracted at the next building cycle
        auto next_env{make_environment(kL2Block + 1)};
        filler.fill_transactions(next_env);
        CHECK_FALSE(test.preconf_pool.registry().contains(c0->hash));
        CHECK(test.pool.get(c0->hash) == nullptr);
    }

    test.loop.stop(/*wait=*/true);
}

}  // namespace rollup::miner
