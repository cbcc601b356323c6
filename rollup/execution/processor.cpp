// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "processor.hpp"

#include <rollup/infra/common/ensure.hpp>

namespace rollup::execution {

tl::expected<Receipt, preconf::ExecutionError> commit_transaction(TransactionProcessor& processor,
                                                                  BuildEnvironment& env,
                                                                  const TransactionPtr& tx) {
    ensure(tx != nullptr, "commit_transaction: null transaction");
    env.state->set_tx_context(tx->hash, env.tcount);
    const AppliedTxCheckpoint checkpoint{
        .snapshot_id = env.state->snapshot(),
        .gas_pool = env.gas_pool.gas(),
        .header_gas_used = env.header.gas_used,
    };

    auto receipt{processor.apply(env, *tx)};
    if (!receipt) {
        env.state->revert_to_snapshot(checkpoint.snapshot_id);
        env.gas_pool.set_gas(checkpoint.gas_pool);
        env.header.gas_used = checkpoint.header_gas_used;
        return receipt;
    }
    env.txs.push_back(tx);
    env.receipts.push_back(*receipt);
    env.checkpoints.push_back(checkpoint);
    ++env.tcount;
    return receipt;
}

bool revert_last_transaction(BuildEnvironment& env, const evmc::bytes32& tx_hash) {
    if (env.txs.empty() || env.checkpoints.empty() || env.txs.back()->hash != tx_hash) {
        return false;
    }
    const auto checkpoint{env.checkpoints.back()};
    env.state->revert_to_snapshot(checkpoint.snapshot_id);
    env.gas_pool.set_gas(checkpoint.gas_pool);
    env.header.gas_used = checkpoint.header_gas_used;
    env.txs.pop_back();
    env.receipts.pop_back();
    env.checkpoints.pop_back();
    --env.tcount;
    return true;
}

}  // namespace rollup::execution
