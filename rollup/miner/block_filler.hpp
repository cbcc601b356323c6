// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rollup/core/types/transaction.hpp>
#include <rollup/execution/environment.hpp>
#include <rollup/execution/processor.hpp>
#include <rollup/miner/preconf_checker.hpp>
#include <rollup/txpool/pool.hpp>
#include <rollup/txpool/preconf_pool.hpp>

namespace rollup::miner {

struct FifoCommitResult {
    //! Applied transactions in admission order
    Transactions sealed;
    //! Transactions from the first one not fitting the block onwards, empty if the block did not fill up
    Transactions unsealed;
};

struct FillResult {
    Transactions sealed_preconf_txs;
    Transactions unsealed_preconf_txs;
    Transactions ordinary_txs;
    //! Ordinary transactions are not considered while preconfirmations are left out of the block
    bool ordinary_skipped{false};
};

//! \brief Fills the block being built, preconfirmation transactions first in admission order
class BlockFiller {
  public:
    BlockFiller(PreconfChecker& checker, txpool::PreconfTxPool& preconf_pool, txpool::TxPool& pool,
                execution::TransactionProcessor& processor)
        : checker_{checker}, preconf_pool_{preconf_pool}, pool_{pool}, processor_{processor} {}

    //! \brief Runs a whole building cycle on \p env
    //! \details Speculative execution is paused for the duration of the fill and resumed on a copy of the filled
    //! environment, even when filling fails.
    FillResult fill_transactions(execution::BuildEnvironment& env);

    //! \brief Applies \p txs in order, stopping at the first one that does not fit the block
    FifoCommitResult commit_fifo_transactions(execution::BuildEnvironment& env, const Transactions& txs);

    //! \brief Applies the ordinary pending transactions, senders in address order and nonce order within a sender
    Transactions commit_transactions(execution::BuildEnvironment& env, const txpool::PendingMap& pending);

  private:
    PreconfChecker& checker_;
    txpool::PreconfTxPool& preconf_pool_;
    txpool::TxPool& pool_;
    execution::TransactionProcessor& processor_;
};

}  // namespace rollup::miner
