// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_filler.hpp"

#include <optional>

#include <gsl/util>

#include <rollup/core/common/util.hpp>
#include <rollup/infra/common/log.hpp>

namespace rollup::miner {

using preconf::ExecutionErrorCode;

FillResult BlockFiller::fill_transactions(execution::BuildEnvironment& env) {
    auto leftover_channel{checker_.pause_preconf()};
    [[maybe_unused]] auto _ = gsl::finally([&]() {
        checker_.unpause_preconf(env.copy(), [this]() { preconf_pool_.preconf_ready(); });
    });

    FillResult result;
    auto pending{pool_.pending()};
    const auto preconf_txs{preconf_pool_.pending_preconf_txs(pending)};
    ROLLUP_DEBUG << "find preconf txs to fill into block count=" << preconf_txs.size();
    if (!preconf_txs.empty()) {
        auto fifo_result{commit_fifo_transactions(env, preconf_txs)};
        result.sealed_preconf_txs = std::move(fifo_result.sealed);
        result.unsealed_preconf_txs = std::move(fifo_result.unsealed);
        preconf_pool_.remove_sealed(result.sealed_preconf_txs);
    }
    if (!leftover_channel->try_send(result.unsealed_preconf_txs)) {
        log::Warning("unsealed preconf txs not handed over, leftover channel closed",
                     {"count", std::to_string(result.unsealed_preconf_txs.size())});
    }

    // Ordinary transactions could otherwise be sealed ahead of preconfirmed ones and make them fail
    if (!result.unsealed_preconf_txs.empty()) {
        ROLLUP_DEBUG << "ending fill transactions due to unsealed preconf txs count=" << result.unsealed_preconf_txs.size();
        result.ordinary_skipped = true;
        return result;
    }

    result.ordinary_txs = commit_transactions(env, pending);
    return result;
}

FifoCommitResult BlockFiller::commit_fifo_transactions(execution::BuildEnvironment& env, const Transactions& txs) {
    FifoCommitResult result;
    std::optional<size_t> break_index;
    for (size_t i{0}; i < txs.size(); ++i) {
        const auto& tx{txs[i]};
        if (env.gas_pool.gas() < kTxGas) {
            ROLLUP_TRACE << "not enough gas for further transactions have=" << env.gas_pool.gas() << " index=" << i << " tx=" << tx->hash;
            break_index = i;
            break;
        }

        const auto receipt{execution::commit_transaction(processor_, env, tx)};
        if (receipt) {
            result.sealed.push_back(tx);
            continue;
        }
        if (receipt.error().code == ExecutionErrorCode::kGasLimitReached) {
            ROLLUP_TRACE << "gas limit exceeded for current block sender=" << tx->from << " index=" << i << " tx=" << tx->hash;
            break_index = i;
            break;
        }
        if (receipt.error().code == ExecutionErrorCode::kNonceTooLow) {
            ROLLUP_TRACE << "skipping transaction with low nonce tx=" << tx->hash << " sender=" << tx->from << " nonce=" << tx->nonce;
        } else {
            ROLLUP_DEBUG << "transaction failed, skipped tx=" << tx->hash << " error=" << receipt.error().to_string();
        }
    }

    if (break_index) {
        result.unsealed.assign(txs.begin() + static_cast<std::ptrdiff_t>(*break_index), txs.end());
        ROLLUP_DEBUG << "unsealed transactions due to gas limit break_index=" << *break_index << " txs=" << txs.size();
    }
    return result;
}

Transactions BlockFiller::commit_transactions(execution::BuildEnvironment& env, const txpool::PendingMap& pending) {
    Transactions committed;
    for (const auto& [sender, txs] : pending) {
        for (const auto& tx : txs) {
            if (env.gas_pool.gas() < kTxGas) {
                ROLLUP_TRACE << "not enough gas for further transactions have=" << env.gas_pool.gas();
                return committed;
            }
            const auto receipt{execution::commit_transaction(processor_, env, tx)};
            if (receipt) {
                committed.push_back(tx);
                continue;
            }
            if (receipt.error().code == ExecutionErrorCode::kNonceTooLow) {
                ROLLUP_TRACE << "skipping transaction with low nonce tx=" << tx->hash << " nonce=" << tx->nonce;
                continue;
            }
            // Later transactions of the sender cannot succeed either
            ROLLUP_DEBUG << "transaction failed, account skipped tx=" << tx->hash << " sender=" << sender
                         << " error=" << receipt.error().to_string();
            break;
        }
    }
    return committed;
}

}  // namespace rollup::miner
