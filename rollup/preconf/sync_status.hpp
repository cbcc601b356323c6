// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <rollup/core/common/base.hpp>

namespace rollup::preconf {

//! \brief Reference to an L1 or L2 block as reported by the rollup node
struct BlockRef {
    evmc::bytes32 hash;
    BlockNum number{0};
    evmc::bytes32 parent_hash;
    uint64_t timestamp{0};  // seconds since epoch

    friend bool operator==(const BlockRef&, const BlockRef&) = default;
};

//! \brief Reference to an L2 block together with the L1 block it derives from
struct L2BlockRef : public BlockRef {
    BlockRef l1_origin;
    uint64_t sequence_number{0};

    friend bool operator==(const L2BlockRef&, const L2BlockRef&) = default;
};

//! \brief Derivation progress of the rollup node
struct SyncStatus {
    BlockRef current_l1;
    BlockRef head_l1;
    L2BlockRef unsafe_l2;
    L2BlockRef engine_sync_target;

    //! \brief Whether every progress counter of \p next is greater or equal than the one in this status
    //! \details A decrease of any counter is the signature of an L1 reorg
    bool is_monotonic_successor(const SyncStatus& next) const;

    std::string to_string() const;

    friend bool operator==(const SyncStatus&, const SyncStatus&) = default;
};

std::ostream& operator<<(std::ostream& out, const SyncStatus& status);

// JSON encoding as returned by optimism_syncStatus
void to_json(nlohmann::json& json, const BlockRef& ref);
void from_json(const nlohmann::json& json, BlockRef& ref);
void to_json(nlohmann::json& json, const L2BlockRef& ref);
void from_json(const nlohmann::json& json, L2BlockRef& ref);
void to_json(nlohmann::json& json, const SyncStatus& status);
void from_json(const nlohmann::json& json, SyncStatus& status);

}  // namespace rollup::preconf
