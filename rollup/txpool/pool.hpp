// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>

#include <evmc/evmc.hpp>

#include <rollup/core/types/transaction.hpp>

namespace rollup::txpool {

//! Executable transactions grouped by sender, each group sorted by nonce, senders sorted by address
using PendingMap = std::map<evmc::address, Transactions>;

//! \brief General purpose transaction pool the preconfirmation intake sits on top of
class TxPool {
  public:
    virtual ~TxPool() = default;

    //! \brief Admits the transactions, \p local ones being exempt from pricing rules
    virtual void add(const Transactions& txs, bool local) = 0;

    //! \return the transaction with the given hash or nullptr
    virtual TransactionPtr get(const evmc::bytes32& hash) const = 0;

    //! \return the currently executable transactions
    virtual PendingMap pending() const = 0;

    //! \return true if the transaction was known and has been removed
    virtual bool remove(const evmc::bytes32& hash) = 0;
};

}  // namespace rollup::txpool
