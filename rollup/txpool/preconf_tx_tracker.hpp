// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>

#include <absl/container/flat_hash_map.h>
#include <boost/signals2/connection.hpp>

#include <rollup/infra/concurrency/worker.hpp>
#include <rollup/preconf/metrics.hpp>
#include <rollup/txpool/journal.hpp>
#include <rollup/txpool/preconf_pool.hpp>

namespace rollup::txpool {

//! \brief Keeps the successful preconfirmations on disk so that they survive a restart
//! \details At startup the journal is replayed into the pool as local transactions, then the journal is
//! periodically rewritten with the successful preconfirmations not sealed yet. Successful verdicts are
//! appended as soon as they are published.
class PreconfTxTracker : public Worker {
  public:
    PreconfTxTracker(JournalSettings settings, PreconfTxPool& preconf_pool, preconf::PreconfMetrics& metrics);
    ~PreconfTxTracker() override;

    //! \brief Adds a transaction to the tracked set, journaling it
    void track(const TransactionPtr& tx);

    //! \brief Adds transactions to the tracked set, \p clean drops the previously tracked ones first
    void track_all(const Transactions& txs, bool clean);

    size_t size() const;

  private:
    void work() final;
    void rejournal();

    JournalSettings settings_;
    PreconfTxPool& preconf_pool_;
    preconf::PreconfMetrics& metrics_;
    TxJournal journal_;

    mutable std::mutex mutex_;
    absl::flat_hash_map<evmc::bytes32, TransactionPtr> tracked_;
    boost::signals2::scoped_connection event_connection_;
};

}  // namespace rollup::txpool
