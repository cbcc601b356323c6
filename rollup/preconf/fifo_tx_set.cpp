// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fifo_tx_set.hpp"

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>
#include <rollup/infra/common/ensure.hpp>
#include <rollup/infra/common/log.hpp>

namespace rollup::preconf {

void FifoTxSet::add(const evmc::address& from, TransactionPtr tx) {
    ensure(tx != nullptr, "FifoTxSet::add: null transaction");
    const auto hash{tx->hash};

    std::scoped_lock lock{mutex_};
    if (const auto it{index_.find(hash)}; it != index_.end()) {
        queue_.erase(it->second);
        index_.erase(it);
        ROLLUP_TRACE << "FifoTxSet: preconf replaced tx=" << hash;
    } else {
        metrics_.on_pending_delta(1);
        ROLLUP_TRACE << "FifoTxSet: preconf added tx=" << hash;
    }
    queue_.push_back(TxEntry{std::move(tx), from, PreconfStatus::kWaiting});
    index_.emplace(hash, std::prev(queue_.end()));
}

bool FifoTxSet::contains(const evmc::bytes32& hash) const {
    std::scoped_lock lock{mutex_};
    return index_.contains(hash);
}

TransactionPtr FifoTxSet::get(const evmc::bytes32& hash) const {
    std::scoped_lock lock{mutex_};
    const auto it{index_.find(hash)};
    return it != index_.end() ? it->second->tx : nullptr;
}

std::optional<PreconfStatus> FifoTxSet::status(const evmc::bytes32& hash) const {
    std::scoped_lock lock{mutex_};
    const auto it{index_.find(hash)};
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second->status;
}

std::optional<PreconfStatus> FifoTxSet::set_status(const evmc::bytes32& hash, PreconfStatus status) {
    std::scoped_lock lock{mutex_};
    const auto it{index_.find(hash)};
    if (it == index_.end()) {
        return std::nullopt;
    }
    it->second->status = status;
    ROLLUP_TRACE << "FifoTxSet: preconf status tx=" << hash << " status=" << status;
    return status;
}

void FifoTxSet::remove(const evmc::bytes32& hash) {
    std::scoped_lock lock{mutex_};
    const auto it{index_.find(hash)};
    if (it == index_.end()) {
        return;
    }
    queue_.erase(it->second);
    index_.erase(it);
    metrics_.on_pending_delta(-1);
    ROLLUP_TRACE << "FifoTxSet: preconf removed tx=" << hash;
}

TxEntries FifoTxSet::clean_timeout() {
    TxEntries removed;
    std::scoped_lock lock{mutex_};
    for (auto it{queue_.begin()}; it != queue_.end();) {
        if (it->status != PreconfStatus::kTimeout) {
            ++it;
            continue;
        }
        index_.erase(it->tx->hash);
        removed.push_back(std::move(*it));
        it = queue_.erase(it);
    }
    if (!removed.empty()) {
        metrics_.on_pending_delta(-static_cast<int64_t>(removed.size()));
        ROLLUP_DEBUG << "FifoTxSet: removed timed out preconf txs count=" << removed.size();
    }
    return removed;
}

void FifoTxSet::forward(const evmc::address& from, uint64_t nonce) {
    ScopedPreconfTimer timer{metrics_, PreconfTimer::kTxPoolForward};
    std::scoped_lock lock{mutex_};
    for (auto it{queue_.begin()}; it != queue_.end();) {
        if (it->from != from || it->tx->nonce >= nonce) {
            ++it;
            continue;
        }
        ROLLUP_TRACE << "FifoTxSet: preconf removed by forward tx=" << it->tx->hash
                     << " nonce=" << nonce << " tx.nonce=" << it->tx->nonce;
        index_.erase(it->tx->hash);
        it = queue_.erase(it);
        metrics_.on_pending_delta(-1);
    }
}

Transactions FifoTxSet::transactions() const {
    std::scoped_lock lock{mutex_};
    Transactions txs;
    txs.reserve(queue_.size());
    for (const auto& entry : queue_) {
        txs.push_back(entry.tx);
    }
    return txs;
}

TxEntries FifoTxSet::tx_entries() const {
    std::scoped_lock lock{mutex_};
    return {queue_.begin(), queue_.end()};
}

size_t FifoTxSet::size() const {
    std::scoped_lock lock{mutex_};
    return index_.size();
}

void FifoTxSet::clear() {
    std::scoped_lock lock{mutex_};
    if (!index_.empty()) {
        metrics_.on_pending_delta(-static_cast<int64_t>(index_.size()));
    }
    queue_.clear();
    index_.clear();
}

}  // namespace rollup::preconf
