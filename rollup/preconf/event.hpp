// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/types/log.hpp>
#include <rollup/preconf/status.hpp>

namespace rollup::preconf {

//! \brief Verdict published once per preconfirmation request to the intake subscribers
struct PreconfTxEvent {
    evmc::bytes32 tx_hash;
    PreconfStatus status{PreconfStatus::kWaiting};
    std::string reason;
    BlockNum predicted_l2_block_number{0};
    Logs logs;
};

void to_json(nlohmann::json& json, const PreconfTxEvent& event);

}  // namespace rollup::preconf
