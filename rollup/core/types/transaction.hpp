// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/common/bytes.hpp>

namespace rollup {

enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
    kDeposit = 0x7e,  // L1 originated deposit
};

//! \brief A transaction as seen by the preconfirmation engine
//! \details Sender and hash are resolved before the transaction reaches the pool and never change afterwards
struct Transaction {
    TransactionType type{TransactionType::kDynamicFee};
    evmc::bytes32 hash;
    evmc::address from;
    std::optional<evmc::address> to{std::nullopt};  // std::nullopt means contract creation
    uint64_t nonce{0};
    uint64_t gas_limit{0};
    intx::uint256 value{0};
    Bytes data;

    // Deposit transactions only
    evmc::bytes32 source_hash;
    intx::uint256 mint{0};
    intx::uint256 eth_value{0};
    intx::uint256 eth_tx_value{0};
    bool is_system_tx{false};

    bool is_deposit() const { return type == TransactionType::kDeposit; }

    std::string to_string() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

using TransactionPtr = std::shared_ptr<const Transaction>;
using Transactions = std::vector<TransactionPtr>;

std::ostream& operator<<(std::ostream& out, const Transaction& txn);

}  // namespace rollup
