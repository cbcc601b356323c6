// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_codec.hpp"

#include <stdexcept>

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>

namespace rollup::l1 {

nlohmann::json make_log_filter_json(const LogFilter& filter) {
    nlohmann::json json;
    json["fromBlock"] = to_quantity(filter.from_block);
    json["toBlock"] = to_quantity(filter.to_block);
    json["address"] = nlohmann::json::array();
    for (const auto& address : filter.addresses) {
        json["address"].push_back(address_to_hex(address));
    }
    json["topics"] = nlohmann::json::array();
    if (!filter.topics.empty()) {
        auto first_topic = nlohmann::json::array();
        for (const auto& topic : filter.topics) {
            first_topic.push_back(to_hex(topic, /*with_prefix=*/true));
        }
        json["topics"].push_back(std::move(first_topic));
    }
    return json;
}

Log make_log(const nlohmann::json& json) {
    Log log;
    log.address = hex_to_address(json.at("address").get<std::string>());
    for (const auto& topic : json.at("topics")) {
        log.topics.push_back(hex_to_bytes32(topic.get<std::string>()));
    }
    const auto data{from_hex(json.at("data").get<std::string>())};
    if (!data) {
        throw std::invalid_argument{"log: invalid data"};
    }
    log.data = *data;
    if (json.contains("blockNumber") && !json["blockNumber"].is_null()) {
        log.block_num = from_quantity(json["blockNumber"]);
    }
    if (json.contains("blockHash") && !json["blockHash"].is_null()) {
        log.block_hash = hex_to_bytes32(json["blockHash"].get<std::string>());
    }
    if (json.contains("transactionHash") && !json["transactionHash"].is_null()) {
        log.tx_hash = hex_to_bytes32(json["transactionHash"].get<std::string>());
    }
    if (json.contains("transactionIndex") && !json["transactionIndex"].is_null()) {
        log.tx_index = static_cast<uint32_t>(from_quantity(json["transactionIndex"]));
    }
    if (json.contains("logIndex") && !json["logIndex"].is_null()) {
        log.index = static_cast<uint32_t>(from_quantity(json["logIndex"]));
    }
    log.removed = json.value("removed", false);
    return log;
}

}  // namespace rollup::l1
