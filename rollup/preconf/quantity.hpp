// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace rollup::preconf {

//! \brief Encodes a number as a JSON-RPC hex quantity
std::string to_quantity(uint64_t value);

//! \brief Decodes a JSON-RPC hex quantity, non-negative JSON integers are accepted too
//! \throws std::invalid_argument on negative, fractional, malformed or more than 64-bit input
uint64_t from_quantity(const nlohmann::json& json);

}  // namespace rollup::preconf
