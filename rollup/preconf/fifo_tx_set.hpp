// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <list>
#include <mutex>
#include <optional>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <evmc/evmc.hpp>

#include <rollup/core/types/transaction.hpp>
#include <rollup/preconf/metrics.hpp>
#include <rollup/preconf/status.hpp>

namespace rollup::preconf {

struct TxEntry {
    TransactionPtr tx;
    evmc::address from;
    PreconfStatus status{PreconfStatus::kWaiting};
};

using TxEntries = std::vector<TxEntry>;

//! \brief Insertion-ordered registry of preconfirmation transactions keyed by hash
//! \details Ordering is by admission, never by timestamp: block transaction order stays deterministic across
//! redundant producers regardless of their clocks. All operations are thread-safe.
class FifoTxSet {
  public:
    explicit FifoTxSet(PreconfMetrics& metrics) : metrics_{metrics} {}

    FifoTxSet(const FifoTxSet&) = delete;
    FifoTxSet& operator=(const FifoTxSet&) = delete;

    //! \brief Appends the transaction at the tail; an already registered hash is moved to the tail as a replacement
    void add(const evmc::address& from, TransactionPtr tx);

    bool contains(const evmc::bytes32& hash) const;

    //! \return the registered transaction or nullptr
    TransactionPtr get(const evmc::bytes32& hash) const;

    //! \return the status of the registered transaction or std::nullopt
    std::optional<PreconfStatus> status(const evmc::bytes32& hash) const;

    //! \brief Unconditionally overwrites the status of the registered transaction
    //! \return the status after the update or std::nullopt if the hash is not registered
    std::optional<PreconfStatus> set_status(const evmc::bytes32& hash, PreconfStatus status);

    void remove(const evmc::bytes32& hash);

    //! \brief Removes every entry in kTimeout status
    //! \return the removed entries in admission order
    TxEntries clean_timeout();

    //! \brief Removes every entry sent by \p from whose nonce is strictly lower than \p nonce
    void forward(const evmc::address& from, uint64_t nonce);

    Transactions transactions() const;
    TxEntries tx_entries() const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

  private:
    using Queue = std::list<TxEntry>;

    PreconfMetrics& metrics_;
    mutable std::mutex mutex_;
    Queue queue_;
    absl::flat_hash_map<evmc::bytes32, Queue::iterator> index_;
};

}  // namespace rollup::preconf
