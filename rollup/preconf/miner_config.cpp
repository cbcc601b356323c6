// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "miner_config.hpp"

#include <sstream>

#include <rollup/core/types/address.hpp>

namespace rollup::preconf {

std::chrono::seconds MinerConfig::mantle_tolerance_duration() const {
    if (env_tolerance_override) {
        return *env_tolerance_override;
    }
    return tolerance_block * kL2BlockTime;
}

std::chrono::seconds MinerConfig::eth_tolerance_duration() const {
    if (l1_tolerance_override) {
        return *l1_tolerance_override;
    }
    return (tolerance_block + kDerivationDelayBlocks + kL1RpcDelayBlocks) * kL1BlockTime;
}

uint64_t MinerConfig::eth_tolerance_block() const {
    if (l1_tolerance_block_override) {
        return *l1_tolerance_block_override;
    }
    return static_cast<uint64_t>(tolerance_block + kDerivationDelayBlocks);
}

std::string MinerConfig::to_string() const {
    std::stringstream out;
    out << "enable_preconf_checker: " << std::boolalpha << enable_preconf_checker
        << " optimism_node_http: " << optimism_node_http
        << " l1_rpc_http: " << l1_rpc_http
        << " l1_deposit_address: " << l1_deposit_address
        << " tolerance_block: " << tolerance_block
        << " mantle_tolerance_duration: " << mantle_tolerance_duration().count() << "s"
        << " eth_tolerance_duration: " << eth_tolerance_duration().count() << "s"
        << " eth_tolerance_block: " << eth_tolerance_block()
        << " preconf_buffer_block: " << preconf_buffer_block;
    return out.str();
}

}  // namespace rollup::preconf
