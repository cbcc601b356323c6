// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <rollup/core/common/bytes.hpp>

namespace rollup {

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

// Parses an address in hex form, with or without 0x prefix.
// Throws std::invalid_argument if hex is not a valid address, unless return_zero_on_err is true.
evmc::address hex_to_address(std::string_view hex, bool return_zero_on_err = false);

std::string address_to_hex(const evmc::address& address);

}  // namespace rollup

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
