// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_checker.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/system_executor.hpp>

#include <rollup/core/common/util.hpp>
#include <rollup/infra/common/log.hpp>
#include <rollup/preconf/deposit.hpp>

namespace rollup::miner {

using preconf::ExecutionErrorCode;
using preconf::GateError;

static uint64_t unix_now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

//! Age of a block whose timestamp is \p timestamp, future blocks have no age
static std::chrono::seconds block_age(uint64_t timestamp) {
    const auto now{unix_now()};
    return std::chrono::seconds{now > timestamp ? static_cast<int64_t>(now - timestamp) : 0};
}

PreconfChecker::PreconfChecker(preconf::MinerConfig config, execution::TransactionProcessor& processor,
                               l1::L1LogSource& log_source, preconf::PreconfMetrics& metrics)
    : config_{std::move(config)}, processor_{processor}, log_source_{log_source}, metrics_{metrics} {
    log::Info("preconf checker", {"miner.config", config_.to_string()});
}

void PreconfChecker::update_sync_status(const preconf::SyncStatus& status) {
    std::optional<std::pair<BlockNum, BlockNum>> deposit_range;
    preconf::SyncStatus accepted;
    bool accepted_ok{true};
    {
        std::scoped_lock lock{mutex_};
        if (!sync_status_) {
            accepted = status;
            deposit_range.emplace(status.unsafe_l2.l1_origin.number, status.head_l1.number);
        } else {
            ROLLUP_DEBUG << "update optimism sync status old: " << *sync_status_ << " new: " << status;
            if (sync_status_->is_monotonic_successor(status)) {
                accepted = status;
                if (sync_status_->unsafe_l2.l1_origin.number != status.unsafe_l2.l1_origin.number ||
                    sync_status_->head_l1.number != status.head_l1.number) {
                    deposit_range.emplace(status.unsafe_l2.l1_origin.number, status.head_l1.number);
                }
            } else {
                log::Error("optimism sync status is not ok, l1 reorg?", {"old", sync_status_->to_string(), "new", status.to_string()});
                accepted = *sync_status_;
                accepted_ok = false;
            }
        }
    }

    if (deposit_range) {
        update_deposit_txs(deposit_range->first, deposit_range->second);
    }

    std::scoped_lock lock{mutex_};
    sync_status_ = accepted;
    sync_status_ok_ = accepted_ok;
}

void PreconfChecker::update_deposit_txs(BlockNum l1_origin, BlockNum head_l1) {
    // Deposits of blocks derived after the L1 origin, up to the L1 head excluded
    const BlockNum start{l1_origin + 1};
    if (head_l1 == 0 || start > head_l1 - 1) {
        std::scoped_lock lock{mutex_};
        deposit_txs_.clear();
        metrics_.on_l1_deposits(true, 0);
        ROLLUP_DEBUG << "update deposit txs: empty range l1_origin=" << l1_origin << " head_l1=" << head_l1;
        return;
    }
    const BlockNum end{head_l1 - 1};

    Transactions deposits;
    try {
        const auto logs{log_source_.filter_logs(l1::LogFilter{
            .from_block = start,
            .to_block = end,
            .addresses = {config_.l1_deposit_address},
            .topics = {preconf::kDepositEventTopic},
        })};
        ROLLUP_TRACE << "filter deposit tx logs start=" << start << " end=" << end << " logs=" << logs.size();
        for (const auto& log : logs) {
            deposits.push_back(preconf::decode_deposit_log(log));
        }
    } catch (const std::runtime_error& e) {
        std::scoped_lock lock{mutex_};
        deposit_txs_.clear();
        metrics_.on_l1_deposits(false, 0);
        log::Error("failed to get deposit txs", {"error", e.what(), "start", std::to_string(start), "end", std::to_string(end)});
        return;
    }

    std::scoped_lock lock{mutex_};
    deposit_txs_ = std::move(deposits);
    metrics_.on_l1_deposits(true, deposit_txs_.size());
    ROLLUP_DEBUG << "update deposit txs l1_origin=" << l1_origin << " head_l1=" << head_l1 << " start=" << start
                 << " end=" << end << " deposit_txs=" << deposit_txs_.size();
}

tl::expected<void, GateError> PreconfChecker::precheck_status() const {
    std::scoped_lock lock{mutex_};
    return precheck();
}

tl::expected<void, GateError> PreconfChecker::precheck() const {
    if (!env_) {
        return tl::unexpected{GateError::kEnvNil};
    }
    if (!sync_status_) {
        return tl::unexpected{GateError::kSyncStatusNil};
    }
    if (!sync_status_ok_) {
        return tl::unexpected{GateError::kSyncStatusNotOk};
    }

    if (std::chrono::steady_clock::now() - env_updated_at_ > config_.mantle_tolerance_duration()) {
        ROLLUP_TRACE << "env too old env.number=" << env_->header.number;
        return tl::unexpected{GateError::kEnvTooOld};
    }

    const auto& status{*sync_status_};
    const auto eth_tolerance{config_.eth_tolerance_duration()};
    if (block_age(status.current_l1.timestamp) > eth_tolerance) {
        ROLLUP_TRACE << "current l1 block too old number=" << status.current_l1.number << " time=" << status.current_l1.timestamp;
        return tl::unexpected{GateError::kCurrentL1BlockTooOld};
    }
    if (block_age(status.head_l1.timestamp) > eth_tolerance) {
        ROLLUP_TRACE << "head l1 block too old number=" << status.head_l1.number << " time=" << status.head_l1.timestamp;
        return tl::unexpected{GateError::kHeadL1BlockTooOld};
    }
    if (status.head_l1.number > status.current_l1.number &&
        status.head_l1.number - status.current_l1.number > config_.eth_tolerance_block()) {
        ROLLUP_TRACE << "current l1 and head l1 too distant current=" << status.current_l1.number << " head=" << status.head_l1.number;
        return tl::unexpected{GateError::kL1DistanceTooLarge};
    }

    const BlockNum env_number{env_->header.number};
    const BlockNum target_number{status.engine_sync_target.number};
    const BlockNum unsafe_number{status.unsafe_l2.number};
    if (env_number < target_number || env_number < unsafe_number) {
        ROLLUP_TRACE << "env behind env.number=" << env_number << " engine_sync_target=" << target_number << " unsafe_l2=" << unsafe_number;
        return tl::unexpected{GateError::kEnvBehindTarget};
    }
    // Deposits of the next L1 block land at most preconf_buffer_block L2 blocks ahead
    if (env_number - target_number > config_.preconf_buffer_block || env_number - unsafe_number > config_.preconf_buffer_block) {
        ROLLUP_TRACE << "env too far ahead env.number=" << env_number << " engine_sync_target=" << target_number << " unsafe_l2=" << unsafe_number;
        return tl::unexpected{GateError::kEnvTooFarAhead};
    }
    return {};
}

tl::expected<Receipt, preconf::PreconfError> PreconfChecker::preconf(const TransactionPtr& tx) {
    preconf::ScopedPreconfTimer timer{metrics_, preconf::PreconfTimer::kMinerExecute};

    std::unique_lock lock{mutex_};
    // Execution waits for the building cycle to hand the environment back
    if (!unpaused_cv_.wait_for(lock, config_.mantle_tolerance_duration(), [this] { return !paused_; })) {
        ROLLUP_TRACE << "preconf paused for too long tx=" << tx->hash;
        return tl::unexpected{preconf::PreconfError{GateError::kEnvTooOld}};
    }
    if (const auto gate{precheck()}; !gate) {
        return tl::unexpected{preconf::PreconfError{gate.error()}};
    }
    ROLLUP_TRACE << "preconf tx=" << tx->hash << " nonce=" << tx->nonce << " env.number=" << env_->header.number;

    // Leftovers replayed at unpause may already be there, so might a nonce too low transaction
    if (const auto* receipt{env_->find_receipt(tx->hash)}) {
        ROLLUP_TRACE << "preconf tx already in block tx=" << tx->hash;
        return *receipt;
    }

    auto receipt{apply_tx_with_reset_env(tx)};
    if (!receipt) {
        return tl::unexpected{preconf::PreconfError{receipt.error()}};
    }
    return std::move(*receipt);
}

tl::expected<Receipt, preconf::ExecutionError> PreconfChecker::apply_tx_with_reset_env(const TransactionPtr& tx) {
    auto receipt{execution::commit_transaction(processor_, *env_, tx)};
    if (receipt || receipt.error().code != ExecutionErrorCode::kGasLimitReached) {
        return receipt;
    }
    // The block is full: following preconfirmations go to the next one
    const auto previous_gas{env_->gas_pool.gas()};
    ++env_->header.number;
    env_->reset_gas_pool();
    ROLLUP_TRACE << "reset env for gas limit reached env.number=" << env_->header.number << " gas(pre)=" << previous_gas
                 << " tx.gas=" << tx->gas_limit << " gas(now)=" << env_->gas_pool.gas() << " tx=" << tx->hash;
    return execution::commit_transaction(processor_, *env_, tx);
}

LeftoverChannelPtr PreconfChecker::pause_preconf() {
    std::scoped_lock lock{mutex_};
    if (leftover_channel_) {
        leftover_channel_->close();
    }
    // Nothing but blocking receives is used on this channel
    leftover_channel_ = std::make_shared<LeftoverChannel>(boost::asio::system_executor{});
    paused_ = true;
    ROLLUP_DEBUG << "pause preconf";
    return leftover_channel_;
}

void PreconfChecker::unpause_preconf(execution::BuildEnvironment env, const std::function<void()>& ready) {
    std::scoped_lock lock{mutex_};
    env_ = std::move(env);
    env_updated_at_ = std::chrono::steady_clock::now();
    ++env_->header.number;
    env_->reset_gas_pool();
    ROLLUP_DEBUG << "unpause preconf env.number=" << env_->header.number << " env.gas=" << env_->gas_pool.gas();

    for (const auto& tx : deposit_txs_) {
        if (const auto receipt{execution::commit_transaction(processor_, *env_, tx)}; !receipt) {
            log::Warning("failed to apply deposit tx", {"error", receipt.error().to_string(), "tx", to_hex(tx->hash, true)});
            continue;
        }
        ROLLUP_TRACE << "applied deposit tx=" << tx->hash;
    }

    Transactions leftovers;
    // Each channel serves a single building cycle
    if (const auto leftover_channel{std::exchange(leftover_channel_, nullptr)}) {
        if (auto received{leftover_channel->receive_for(config_.leftover_wait_timeout)}) {
            leftovers = std::move(*received);
        } else {
            log::Error("no received unsealed preconf txs to apply");
        }
    }
    for (const auto& tx : leftovers) {
        const auto receipt{apply_tx_with_reset_env(tx)};
        if (!receipt) {
            log::Warning("failed to apply unsealed preconf tx", {"error", receipt.error().to_string(), "tx", to_hex(tx->hash, true)});
            continue;
        }
        ROLLUP_TRACE << "applied unsealed preconf tx=" << tx->hash << " nonce=" << tx->nonce
                     << " env.gas=" << env_->gas_pool.gas() << " success=" << receipt->success;
    }

    metrics_.on_env_block_number(env_->header.number);
    paused_ = false;
    unpaused_cv_.notify_all();
    if (ready) {
        ready();
    }
    log::Info("ready to preconf", {"env.number", std::to_string(env_->header.number),
                                   "env.gas", std::to_string(env_->gas_pool.gas()),
                                   "deposit_txs", std::to_string(deposit_txs_.size()),
                                   "unsealed_preconf_txs", std::to_string(leftovers.size())});
}

bool PreconfChecker::revert_tx(const evmc::bytes32& tx_hash) {
    std::scoped_lock lock{mutex_};
    if (!env_) {
        return false;
    }
    return execution::revert_last_transaction(*env_, tx_hash);
}

std::optional<execution::BuildEnvironment> PreconfChecker::release_environment() {
    std::scoped_lock lock{mutex_};
    auto env{std::move(env_)};
    env_.reset();
    return env;
}

std::optional<preconf::SyncStatus> PreconfChecker::sync_status() const {
    std::scoped_lock lock{mutex_};
    return sync_status_;
}

bool PreconfChecker::is_sync_status_ok() const {
    std::scoped_lock lock{mutex_};
    return sync_status_ok_;
}

Transactions PreconfChecker::deposit_txs() const {
    std::scoped_lock lock{mutex_};
    return deposit_txs_;
}

std::optional<BlockNum> PreconfChecker::env_block_number() const {
    std::scoped_lock lock{mutex_};
    if (!env_) return std::nullopt;
    return env_->header.number;
}

}  // namespace rollup::miner
