// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>

namespace rollup::preconf {

using namespace evmc::literals;

//! L2 block time of the rollup
inline constexpr std::chrono::seconds kL2BlockTime{2};

//! L1 block time
inline constexpr std::chrono::seconds kL1BlockTime{12};

//! Fixed delay in L1 blocks before the rollup node starts deriving a block
inline constexpr int64_t kDerivationDelayBlocks{3};

//! Possible delay in L1 blocks for the L1 node to report the latest block
inline constexpr int64_t kL1RpcDelayBlocks{2};

//! \brief Configuration of the speculative executor and its sync status gate
struct MinerConfig {
    bool enable_preconf_checker{false};
    std::string optimism_node_http{"http://localhost:7545"};
    std::string l1_rpc_http{"http://localhost:8545"};
    evmc::address l1_deposit_address{0xa513E6E4b8f2a923D98304ec87F64353C4D5C853_address};
    //! Base tolerance in blocks all the derived tolerances are computed from
    int64_t tolerance_block{3};
    //! Max distance in L2 blocks the environment may run ahead of the rollup node targets
    uint64_t preconf_buffer_block{6};
    //! Timeout of every request sent to the rollup node or the L1 node
    std::chrono::milliseconds request_timeout{5000};
    //! Interval between two consecutive rollup node polls
    std::chrono::milliseconds sync_status_poll_interval{1000};
    //! How long UnpausePreconf waits for the leftover preconfirmation transactions
    std::chrono::milliseconds leftover_wait_timeout{1000};

    //! Overrides of the tolerances derived from tolerance_block
    std::optional<std::chrono::seconds> env_tolerance_override;
    std::optional<std::chrono::seconds> l1_tolerance_override;
    std::optional<uint64_t> l1_tolerance_block_override;

    //! Max age of the build environment since its last handoff
    std::chrono::seconds mantle_tolerance_duration() const;

    //! Max age of the current and head L1 blocks
    std::chrono::seconds eth_tolerance_duration() const;

    //! Max distance in blocks between current and head L1 blocks
    uint64_t eth_tolerance_block() const;

    std::string to_string() const;
};

}  // namespace rollup::preconf
