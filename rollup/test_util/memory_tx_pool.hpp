// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>
#include <vector>

#include <rollup/txpool/pool.hpp>

namespace rollup::test_util {

//! \brief Transaction pool keeping every admitted transaction pending, without any validation
class MemoryTxPool : public txpool::TxPool {
  public:
    void add(const Transactions& txs, bool local) override;
    TransactionPtr get(const evmc::bytes32& hash) const override;
    txpool::PendingMap pending() const override;
    bool remove(const evmc::bytes32& hash) override;

    size_t size() const;

    //! Number of transactions admitted as local
    size_t local_count() const;

  private:
    mutable std::mutex mutex_;
    txpool::PendingMap pending_;
    size_t local_count_{0};
};

}  // namespace rollup::test_util
