// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <rollup/infra/common/ensure.hpp>

namespace rollup::execution {

tl::expected<void, preconf::ExecutionError> GasPool::sub_gas(uint64_t amount) {
    if (gas_ < amount) {
        return tl::unexpected{preconf::ExecutionError{
            .code = preconf::ExecutionErrorCode::kGasLimitReached,
            .message = "gas limit reached",
        }};
    }
    gas_ -= amount;
    return {};
}

BuildEnvironment::BuildEnvironment(BlockHeader block_header, std::unique_ptr<ExecutionState> execution_state)
    : header{block_header}, gas_pool{block_header.gas_limit}, state{std::move(execution_state)} {
    ensure(state != nullptr, "BuildEnvironment: null execution state");
}

BuildEnvironment BuildEnvironment::copy() const {
    BuildEnvironment env{header, state->copy()};
    env.gas_pool = gas_pool;
    env.tcount = tcount;
    env.txs = txs;
    env.receipts = receipts;
    return env;
}

const Receipt* BuildEnvironment::find_receipt(const evmc::bytes32& tx_hash) const {
    for (const auto& receipt : receipts) {
        if (receipt.tx_hash == tx_hash) {
            return &receipt;
        }
    }
    return nullptr;
}

}  // namespace rollup::execution
