// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sync_status.hpp"

#include <sstream>
#include <stdexcept>

#include <rollup/core/common/util.hpp>
#include <rollup/preconf/quantity.hpp>

namespace rollup::preconf {

bool SyncStatus::is_monotonic_successor(const SyncStatus& next) const {
    return current_l1.number <= next.current_l1.number &&
           head_l1.number <= next.head_l1.number &&
           unsafe_l2.number <= next.unsafe_l2.number &&
           unsafe_l2.l1_origin.number <= next.unsafe_l2.l1_origin.number &&
           engine_sync_target.number <= next.engine_sync_target.number;
}

std::string SyncStatus::to_string() const {
    std::stringstream out;
    out << *this;
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const SyncStatus& status) {
    out << "current_l1: " << status.current_l1.number
        << " head_l1: " << status.head_l1.number
        << " unsafe_l2: " << status.unsafe_l2.number
        << " unsafe_l2.l1_origin: " << status.unsafe_l2.l1_origin.number
        << " engine_sync_target: " << status.engine_sync_target.number;
    return out;
}

//! Block numbers and timestamps are plain JSON numbers or hex quantities, absent ones are zero
static uint64_t number_from_json(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) {
        return 0;
    }
    return from_quantity(json.at(key));
}

static evmc::bytes32 hash_from_json(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return {};
    }
    return hex_to_bytes32(json.at(key).get<std::string>());
}

void to_json(nlohmann::json& json, const BlockRef& ref) {
    json["hash"] = to_hex(ref.hash, /*with_prefix=*/true);
    json["number"] = ref.number;
    json["parentHash"] = to_hex(ref.parent_hash, /*with_prefix=*/true);
    json["timestamp"] = ref.timestamp;
}

void from_json(const nlohmann::json& json, BlockRef& ref) {
    ref.hash = hash_from_json(json, "hash");
    ref.number = number_from_json(json, "number");
    ref.parent_hash = hash_from_json(json, "parentHash");
    ref.timestamp = number_from_json(json, "timestamp");
}

void to_json(nlohmann::json& json, const L2BlockRef& ref) {
    to_json(json, static_cast<const BlockRef&>(ref));
    json["l1origin"] = nlohmann::json{{"hash", to_hex(ref.l1_origin.hash, /*with_prefix=*/true)},
                                      {"number", ref.l1_origin.number}};
    json["sequenceNumber"] = ref.sequence_number;
}

void from_json(const nlohmann::json& json, L2BlockRef& ref) {
    from_json(json, static_cast<BlockRef&>(ref));
    if (json.contains("l1origin")) {
        const auto& origin = json.at("l1origin");
        ref.l1_origin.hash = hash_from_json(origin, "hash");
        ref.l1_origin.number = number_from_json(origin, "number");
    }
    ref.sequence_number = number_from_json(json, "sequenceNumber");
}

void to_json(nlohmann::json& json, const SyncStatus& status) {
    json["current_l1"] = status.current_l1;
    json["head_l1"] = status.head_l1;
    json["unsafe_l2"] = status.unsafe_l2;
    json["engine_sync_target"] = status.engine_sync_target;
}

void from_json(const nlohmann::json& json, SyncStatus& status) {
    for (const char* key : {"current_l1", "head_l1", "unsafe_l2", "engine_sync_target"}) {
        if (!json.contains(key)) {
            throw std::invalid_argument{std::string{"sync status: missing field "} + key};
        }
    }
    json.at("current_l1").get_to(status.current_l1);
    json.at("head_l1").get_to(status.head_l1);
    json.at("unsafe_l2").get_to(status.unsafe_l2);
    json.at("engine_sync_target").get_to(status.engine_sync_target);
}

}  // namespace rollup::preconf
