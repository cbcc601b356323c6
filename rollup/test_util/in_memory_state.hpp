// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <rollup/execution/environment.hpp>

namespace rollup::test_util {

//! \brief Account nonces and balances kept in memory with a journal of changes for nested snapshots
class InMemoryState : public execution::ExecutionState {
  public:
    uint64_t nonce(const evmc::address& address) const;
    void set_nonce(const evmc::address& address, uint64_t nonce);

    intx::uint256 balance(const evmc::address& address) const;
    void add_balance(const evmc::address& address, const intx::uint256& amount);

    const evmc::bytes32& tx_hash() const { return tx_hash_; }
    size_t tx_index() const { return tx_index_; }

    int snapshot() override;
    void revert_to_snapshot(int snapshot_id) override;
    void set_tx_context(const evmc::bytes32& tx_hash, size_t tx_index) override;
    std::unique_ptr<execution::ExecutionState> copy() const override;

  private:
    struct Account {
        uint64_t nonce{0};
        intx::uint256 balance{0};
    };
    struct JournalEntry {
        evmc::address address;
        std::optional<Account> previous;
    };

    void record(const evmc::address& address);

    std::map<evmc::address, Account> accounts_;
    std::vector<JournalEntry> journal_;
    std::vector<size_t> snapshots_;  // journal length at each snapshot
    evmc::bytes32 tx_hash_;
    size_t tx_index_{0};
};

}  // namespace rollup::test_util
