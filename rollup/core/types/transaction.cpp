// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <sstream>

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>

namespace rollup {

std::string Transaction::to_string() const {
    std::stringstream out;
    out << *this;
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const Transaction& txn) {
    out << "type: 0x" << std::hex << static_cast<int>(txn.type) << std::dec
        << " hash: " << txn.hash
        << " from: " << txn.from
        << " to: ";
    if (txn.to) {
        out << *txn.to;
    } else {
        out << "null";
    }
    out << " nonce: " << txn.nonce
        << " gas_limit: " << txn.gas_limit
        << " value: " << intx::to_string(txn.value);
    if (txn.is_deposit()) {
        out << " source_hash: " << txn.source_hash
            << " mint: " << intx::to_string(txn.mint);
    }
    return out;
}

}  // namespace rollup
