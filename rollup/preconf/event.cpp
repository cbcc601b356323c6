// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "event.hpp"

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>
#include <rollup/preconf/quantity.hpp>

namespace rollup::preconf {

void to_json(nlohmann::json& json, const PreconfTxEvent& event) {
    json["txHash"] = to_hex(event.tx_hash, /*with_prefix=*/true);
    json["status"] = to_string(event.status);
    json["reason"] = event.reason;
    json["blockHeight"] = to_quantity(event.predicted_l2_block_number);
    auto logs = nlohmann::json::array();
    for (const auto& log : event.logs) {
        nlohmann::json entry;
        entry["address"] = address_to_hex(log.address);
        auto topics = nlohmann::json::array();
        for (const auto& topic : log.topics) {
            topics.push_back(to_hex(topic, /*with_prefix=*/true));
        }
        entry["topics"] = std::move(topics);
        entry["data"] = to_hex(log.data, /*with_prefix=*/true);
        entry["logIndex"] = to_quantity(log.index);
        logs.push_back(std::move(entry));
    }
    json["receipt"] = nlohmann::json{{"logs", std::move(logs)}};
}

}  // namespace rollup::preconf
