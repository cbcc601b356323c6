// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_data.hpp"

#include <chrono>
#include <memory>

#include <intx/intx.hpp>

#include <rollup/core/common/util.hpp>
#include <rollup/preconf/deposit.hpp>
#include <rollup/test_util/in_memory_state.hpp>

namespace rollup::test_util {

TransactionPtr make_transaction(const evmc::address& from, uint64_t nonce, std::optional<evmc::address> to,
                                uint64_t gas_limit, Bytes data) {
    auto tx{std::make_shared<Transaction>()};
    tx->type = TransactionType::kDynamicFee;
    tx->from = from;
    tx->to = to;
    tx->nonce = nonce;
    tx->gas_limit = gas_limit;
    tx->data = std::move(data);

    Bytes preimage{from.bytes, kAddressLength};
    uint8_t word[8];
    intx::be::unsafe::store(word, nonce);
    preimage.append(word, sizeof(word));
    intx::be::unsafe::store(word, gas_limit);
    preimage.append(word, sizeof(word));
    if (to) {
        preimage.append(to->bytes, kAddressLength);
    }
    preimage.append(tx->data);
    tx->hash = keccak256_hash(preimage);
    return tx;
}

TransactionPtr make_deposit(const evmc::bytes32& l1_block_hash, uint64_t log_index, uint64_t gas_limit) {
    auto tx{std::make_shared<Transaction>()};
    tx->type = TransactionType::kDeposit;
    tx->source_hash = preconf::user_deposit_source_hash(l1_block_hash, log_index);
    tx->hash = tx->source_hash;
    tx->from = kDepositor;
    tx->to = kRecipient;
    tx->gas_limit = gas_limit;
    tx->mint = 1;
    return tx;
}

Log make_deposit_log(const evmc::bytes32& l1_block_hash, uint32_t log_index, const evmc::address& from,
                     const evmc::address& to, uint64_t gas_limit) {
    // mint, value, gas, isCreation, no data
    Bytes opaque(32 + 32 + 8 + 1, '\0');
    opaque[31] = 1;
    intx::be::unsafe::store(opaque.data() + 64, gas_limit);

    Bytes data(64, '\0');
    data[31] = 0x20;
    data[63] = static_cast<uint8_t>(opaque.size());
    data.append(opaque);
    data.resize(64 + 96, '\0');  // ABI padding to a multiple of 32 bytes

    return Log{
        .address = 0xa513e6e4b8f2a923d98304ec87f64353c4d5c853_address,
        .topics = {preconf::kDepositEventTopic, to_bytes32(byte_view(from.bytes)), to_bytes32(byte_view(to.bytes)),
                   evmc::bytes32{}},  // version 0
        .data = std::move(data),
        .block_num = 10,
        .block_hash = l1_block_hash,
        .index = log_index,
    };
}

preconf::SyncStatus make_sync_status(BlockNum l1, BlockNum l2, uint64_t l1_timestamp) {
    preconf::SyncStatus status;
    status.current_l1.number = l1;
    status.current_l1.timestamp = l1_timestamp;
    status.head_l1.number = l1;
    status.head_l1.timestamp = l1_timestamp;
    status.unsafe_l2.number = l2;
    status.unsafe_l2.timestamp = l1_timestamp;
    status.unsafe_l2.l1_origin.number = l1 > 0 ? l1 - 1 : 0;
    status.engine_sync_target.number = l2;
    status.engine_sync_target.l1_origin.number = l1 > 0 ? l1 - 1 : 0;
    return status;
}

execution::BuildEnvironment make_environment(BlockNum number, uint64_t gas_limit) {
    return execution::BuildEnvironment{execution::BlockHeader{.number = number, .gas_limit = gas_limit},
                                       std::make_unique<InMemoryState>()};
}

uint64_t unix_now() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

}  // namespace rollup::test_util
