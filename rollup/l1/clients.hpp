// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string_view>

#include <rollup/l1/json_rpc_client.hpp>
#include <rollup/l1/sources.hpp>

namespace rollup::l1 {

//! \brief Rollup node client reading the derivation progress through optimism_syncStatus
class OpNodeClient : public SyncStatusSource {
  public:
    OpNodeClient(std::string_view url, std::chrono::milliseconds timeout) : client_{url, timeout} {}

    preconf::SyncStatus sync_status() override;

  private:
    JsonRpcClient client_;
};

//! \brief L1 node client reading logs through eth_getLogs
class L1LogClient : public L1LogSource {
  public:
    L1LogClient(std::string_view url, std::chrono::milliseconds timeout) : client_{url, timeout} {}

    Logs filter_logs(const LogFilter& filter) override;

  private:
    JsonRpcClient client_;
};

}  // namespace rollup::l1
