// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_tx_pool.hpp"

#include <algorithm>

namespace rollup::test_util {

void MemoryTxPool::add(const Transactions& txs, bool local) {
    std::scoped_lock lock{mutex_};
    for (const auto& tx : txs) {
        auto& sender_txs{pending_[tx->from]};
        std::erase_if(sender_txs, [&](const auto& pending_tx) { return pending_tx->nonce == tx->nonce; });
        const auto position{std::upper_bound(sender_txs.begin(), sender_txs.end(), tx->nonce,
                                             [](uint64_t nonce, const auto& pending_tx) { return nonce < pending_tx->nonce; })};
        sender_txs.insert(position, tx);
        if (local) ++local_count_;
    }
}

TransactionPtr MemoryTxPool::get(const evmc::bytes32& hash) const {
    std::scoped_lock lock{mutex_};
    for (const auto& [_, sender_txs] : pending_) {
        for (const auto& tx : sender_txs) {
            if (tx->hash == hash) return tx;
        }
    }
    return nullptr;
}

txpool::PendingMap MemoryTxPool::pending() const {
    std::scoped_lock lock{mutex_};
    return pending_;
}

bool MemoryTxPool::remove(const evmc::bytes32& hash) {
    std::scoped_lock lock{mutex_};
    for (auto it{pending_.begin()}; it != pending_.end(); ++it) {
        auto& sender_txs{it->second};
        if (std::erase_if(sender_txs, [&](const auto& tx) { return tx->hash == hash; }) > 0) {
            if (sender_txs.empty()) {
                pending_.erase(it);
            }
            return true;
        }
    }
    return false;
}

size_t MemoryTxPool::size() const {
    std::scoped_lock lock{mutex_};
    size_t count{0};
    for (const auto& [_, sender_txs] : pending_) {
        count += sender_txs.size();
    }
    return count;
}

size_t MemoryTxPool::local_count() const {
    std::scoped_lock lock{mutex_};
    return local_count_;
}

}  // namespace rollup::test_util
