// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <rollup/core/types/log.hpp>
#include <rollup/l1/sources.hpp>
#include <rollup/preconf/quantity.hpp>

namespace rollup::l1 {

using preconf::from_quantity;
using preconf::to_quantity;

//! \brief eth_getLogs filter object
nlohmann::json make_log_filter_json(const LogFilter& filter);

//! \throws std::invalid_argument or nlohmann::json::exception on malformed input
Log make_log(const nlohmann::json& json);

}  // namespace rollup::l1
