// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>

#include <evmc/evmc.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/common/bytes.hpp>
#include <rollup/core/types/log.hpp>
#include <rollup/core/types/transaction.hpp>
#include <rollup/execution/environment.hpp>
#include <rollup/preconf/sync_status.hpp>

namespace rollup::test_util {

using namespace evmc::literals;

inline constexpr evmc::address kSenderA{0x00000000000000000000000000000000000000aa_address};
inline constexpr evmc::address kSenderB{0x00000000000000000000000000000000000000bb_address};
inline constexpr evmc::address kSenderC{0x00000000000000000000000000000000000000cc_address};
inline constexpr evmc::address kRecipient{0x4200000000000000000000000000000000000016_address};
inline constexpr evmc::address kDepositor{0x1276878a594ca255338adfa4d48449f69242fca0_address};

//! \brief Ordinary transaction whose hash is derived from all its fields
TransactionPtr make_transaction(const evmc::address& from, uint64_t nonce,
                                std::optional<evmc::address> to = kRecipient,
                                uint64_t gas_limit = kTxGas, Bytes data = {});

//! \brief Deposit transaction as decoded from the log at \p log_index of L1 block \p l1_block_hash
TransactionPtr make_deposit(const evmc::bytes32& l1_block_hash, uint64_t log_index, uint64_t gas_limit = 100'000);

//! \brief TransactionDeposited log carrying a version 0 deposit
Log make_deposit_log(const evmc::bytes32& l1_block_hash, uint32_t log_index, const evmc::address& from,
                     const evmc::address& to, uint64_t gas_limit);

//! \brief Sync status of a healthy rollup node
//! \details current and head L1 at \p l1, unsafe L2 origin at l1 - 1 and L2 targets at \p l2
preconf::SyncStatus make_sync_status(BlockNum l1, BlockNum l2, uint64_t l1_timestamp);

//! \brief Environment building block \p number on top of an empty InMemoryState
execution::BuildEnvironment make_environment(BlockNum number, uint64_t gas_limit = 30'000'000);

//! \brief Current time in seconds since epoch
uint64_t unix_now();

}  // namespace rollup::test_util
