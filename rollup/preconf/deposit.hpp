// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <evmc/evmc.hpp>

#include <rollup/core/types/log.hpp>
#include <rollup/core/types/transaction.hpp>

namespace rollup::preconf {

using namespace evmc::literals;

//! keccak256("TransactionDeposited(address,address,uint256,bytes)")
inline constexpr evmc::bytes32 kDepositEventTopic{
    0xb3813568d9991fc951961fcb4c784893574240a28925604d09fc577c55bb7c32_bytes32};

//! Opaque data layout: mint, value, gas, isCreation, data
inline constexpr uint64_t kDepositVersion0{0};

//! Opaque data layout: mint, value, ethValue, ethTxValue, gas, isCreation, data
inline constexpr uint64_t kDepositVersion1{1};

class DepositDecodingError : public std::runtime_error {
  public:
    explicit DepositDecodingError(const std::string& message) : std::runtime_error{"deposit log: " + message} {}
};

//! \brief Source hash of a user deposit: keccak256(bytes32(0) ++ keccak256(l1_block_hash ++ bytes32(log_index)))
evmc::bytes32 user_deposit_source_hash(const evmc::bytes32& l1_block_hash, uint64_t log_index);

//! \brief Turns a TransactionDeposited log emitted by the L1 deposit contract into a deposit transaction
//! \details The deposit is identified by its source hash, which is unique per L1 log
//! \throws DepositDecodingError if the log is not a well-formed deposit event
TransactionPtr decode_deposit_log(const Log& log);

}  // namespace rollup::preconf
