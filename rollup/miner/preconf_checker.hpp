// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include <tl/expected.hpp>

#include <rollup/core/types/receipt.hpp>
#include <rollup/core/types/transaction.hpp>
#include <rollup/execution/environment.hpp>
#include <rollup/execution/processor.hpp>
#include <rollup/infra/concurrency/oneshot_channel.hpp>
#include <rollup/l1/sources.hpp>
#include <rollup/preconf/errors.hpp>
#include <rollup/preconf/metrics.hpp>
#include <rollup/preconf/miner_config.hpp>
#include <rollup/preconf/sync_status.hpp>

namespace rollup::miner {

//! Hands the preconfirmation transactions left out of a block over to the next building cycle
using LeftoverChannel = concurrency::OneshotChannel<Transactions>;
using LeftoverChannelPtr = std::shared_ptr<LeftoverChannel>;

//! \brief Speculative executor running preconfirmation transactions against the environment lent by the builder
//! \details Execution is gated on the rollup node derivation progress: transactions are only preconfirmed while
//! the node follows L1 closely and the environment is close to the L2 head. All operations are thread-safe.
class PreconfChecker {
  public:
    PreconfChecker(preconf::MinerConfig config, execution::TransactionProcessor& processor,
                   l1::L1LogSource& log_source, preconf::PreconfMetrics& metrics);

    PreconfChecker(const PreconfChecker&) = delete;
    PreconfChecker& operator=(const PreconfChecker&) = delete;

    //! \brief Accepts \p status if no progress counter decreased, otherwise flags the sync status as not ok
    //! \details The deposit window is refreshed when the L1 origin of the unsafe L2 head or the L1 head moved.
    //! L1 is queried without holding the lock.
    void update_sync_status(const preconf::SyncStatus& status);

    //! \brief Evaluates the gate against the current environment and sync status
    tl::expected<void, preconf::GateError> precheck_status() const;

    //! \brief Speculatively executes \p tx on top of the current environment
    //! \details A transaction already applied in the environment gets its receipt back without execution.
    //! When the block gas limit is reached the environment moves on to the next block and execution is retried once.
    //! While a building cycle is in progress execution waits for unpause_preconf, at most the environment tolerance.
    tl::expected<Receipt, preconf::PreconfError> preconf(const TransactionPtr& tx);

    //! \brief Starts a building cycle, speculative execution stays off until unpause_preconf
    //! \return the channel the builder delivers the unsealed preconfirmation transactions on
    LeftoverChannelPtr pause_preconf();

    //! \brief Installs the environment of the next block
    //! \details Deposits of the current window are applied first, then the unsealed preconfirmation
    //! transactions delivered on the channel returned by pause_preconf. \p ready is invoked last.
    void unpause_preconf(execution::BuildEnvironment env, const std::function<void()>& ready);

    //! \brief Undoes \p tx_hash if it is the last transaction applied to the environment
    bool revert_tx(const evmc::bytes32& tx_hash);

    //! \brief Takes the environment back, speculative execution is off afterwards
    std::optional<execution::BuildEnvironment> release_environment();

    //! Last accepted sync status, if any
    std::optional<preconf::SyncStatus> sync_status() const;
    bool is_sync_status_ok() const;
    Transactions deposit_txs() const;

    //! Block number of the environment, if any
    std::optional<BlockNum> env_block_number() const;

    const preconf::MinerConfig& config() const { return config_; }

  private:
    tl::expected<void, preconf::GateError> precheck() const;
    tl::expected<Receipt, preconf::ExecutionError> apply_tx_with_reset_env(const TransactionPtr& tx);
    void update_deposit_txs(BlockNum l1_origin, BlockNum head_l1);

    preconf::MinerConfig config_;
    execution::TransactionProcessor& processor_;
    l1::L1LogSource& log_source_;
    preconf::PreconfMetrics& metrics_;

    mutable std::mutex mutex_;
    std::condition_variable unpaused_cv_;
    bool paused_{false};
    std::optional<execution::BuildEnvironment> env_;
    std::chrono::steady_clock::time_point env_updated_at_;
    std::optional<preconf::SyncStatus> sync_status_;
    bool sync_status_ok_{false};
    Transactions deposit_txs_;  // to be applied before any preconfirmation
    LeftoverChannelPtr leftover_channel_;
};

}  // namespace rollup::miner
