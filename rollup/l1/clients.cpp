// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "clients.hpp"

#include <stdexcept>

#include <rollup/infra/common/log.hpp>
#include <rollup/l1/json_codec.hpp>

namespace rollup::l1 {

preconf::SyncStatus OpNodeClient::sync_status() {
    const auto result = client_.call("optimism_syncStatus", nlohmann::json::array());
    try {
        return result.get<preconf::SyncStatus>();
    } catch (const nlohmann::json::exception& e) {
        throw JsonRpcError{"malformed optimism_syncStatus result: " + std::string{e.what()}};
    } catch (const std::invalid_argument& e) {
        throw JsonRpcError{"malformed optimism_syncStatus result: " + std::string{e.what()}};
    }
}

Logs L1LogClient::filter_logs(const LogFilter& filter) {
    const auto result = client_.call("eth_getLogs", nlohmann::json::array({make_log_filter_json(filter)}));
    if (!result.is_array()) {
        throw JsonRpcError{"malformed eth_getLogs result: array expected"};
    }
    Logs logs;
    logs.reserve(result.size());
    try {
        for (const auto& log_json : result) {
            logs.push_back(make_log(log_json));
        }
    } catch (const nlohmann::json::exception& e) {
        throw JsonRpcError{"malformed eth_getLogs result: " + std::string{e.what()}};
    } catch (const std::invalid_argument& e) {
        throw JsonRpcError{"malformed eth_getLogs result: " + std::string{e.what()}};
    }
    ROLLUP_TRACE << "L1LogClient::filter_logs from=" << filter.from_block << " to=" << filter.to_block
                 << " logs=" << logs.size();
    return logs;
}

}  // namespace rollup::l1
