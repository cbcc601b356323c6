// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_state.hpp"

#include <rollup/infra/common/ensure.hpp>

namespace rollup::test_util {

uint64_t InMemoryState::nonce(const evmc::address& address) const {
    const auto it{accounts_.find(address)};
    return it != accounts_.end() ? it->second.nonce : 0;
}

void InMemoryState::set_nonce(const evmc::address& address, uint64_t nonce) {
    record(address);
    accounts_[address].nonce = nonce;
}

intx::uint256 InMemoryState::balance(const evmc::address& address) const {
    const auto it{accounts_.find(address)};
    return it != accounts_.end() ? it->second.balance : 0;
}

void InMemoryState::add_balance(const evmc::address& address, const intx::uint256& amount) {
    record(address);
    accounts_[address].balance += amount;
}

int InMemoryState::snapshot() {
    snapshots_.push_back(journal_.size());
    return static_cast<int>(snapshots_.size() - 1);
}

void InMemoryState::revert_to_snapshot(int snapshot_id) {
    ensure(snapshot_id >= 0 && static_cast<size_t>(snapshot_id) < snapshots_.size(), "InMemoryState: unknown snapshot");
    const size_t journal_size{snapshots_[static_cast<size_t>(snapshot_id)]};
    while (journal_.size() > journal_size) {
        auto& entry{journal_.back()};
        if (entry.previous) {
            accounts_[entry.address] = *entry.previous;
        } else {
            accounts_.erase(entry.address);
        }
        journal_.pop_back();
    }
    snapshots_.resize(static_cast<size_t>(snapshot_id));
}

void InMemoryState::set_tx_context(const evmc::bytes32& tx_hash, size_t tx_index) {
    tx_hash_ = tx_hash;
    tx_index_ = tx_index;
}

std::unique_ptr<execution::ExecutionState> InMemoryState::copy() const {
    auto state{std::make_unique<InMemoryState>()};
    state->accounts_ = accounts_;
    state->tx_hash_ = tx_hash_;
    state->tx_index_ = tx_index_;
    return state;
}

void InMemoryState::record(const evmc::address& address) {
    const auto it{accounts_.find(address)};
    journal_.push_back({address, it != accounts_.end() ? std::make_optional(it->second) : std::nullopt});
}

}  // namespace rollup::test_util
