// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/types/log.hpp>
#include <rollup/core/types/transaction.hpp>

namespace rollup {

struct Receipt {
    TransactionType type{TransactionType::kDynamicFee};
    evmc::bytes32 tx_hash;
    bool success{false};
    uint64_t gas_used{0};
    uint64_t cumulative_gas_used{0};
    BlockNum block_num{0};
    uint32_t tx_index{0};
    Logs logs;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

}  // namespace rollup
