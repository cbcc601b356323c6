// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/types/log.hpp>
#include <rollup/preconf/sync_status.hpp>

namespace rollup::l1 {

//! \brief Source of the rollup node derivation progress
class SyncStatusSource {
  public:
    virtual ~SyncStatusSource() = default;

    //! \throws std::runtime_error if the status cannot be retrieved
    virtual preconf::SyncStatus sync_status() = 0;
};

//! \brief Inclusive block range query over the L1 logs
struct LogFilter {
    BlockNum from_block{0};
    BlockNum to_block{0};
    std::vector<evmc::address> addresses;
    //! Accepted values of the first topic, any if empty
    std::vector<evmc::bytes32> topics;

    friend bool operator==(const LogFilter&, const LogFilter&) = default;
};

//! \brief Source of the logs emitted on L1
class L1LogSource {
  public:
    virtual ~L1LogSource() = default;

    //! \throws std::runtime_error if the logs cannot be retrieved
    virtual Logs filter_logs(const LogFilter& filter) = 0;
};

}  // namespace rollup::l1
