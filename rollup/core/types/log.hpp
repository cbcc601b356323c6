// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/common/bytes.hpp>

namespace rollup {

struct Log {
    /* raw fields */
    evmc::address address;
    std::vector<evmc::bytes32> topics;
    Bytes data;

    /* derived fields, filled by the node which returned the log */
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    evmc::bytes32 tx_hash;
    uint32_t tx_index{0};
    uint32_t index{0};
    bool removed{false};

    friend bool operator==(const Log&, const Log&) = default;
};

using Logs = std::vector<Log>;

}  // namespace rollup
