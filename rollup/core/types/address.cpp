// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <stdexcept>

#include <rollup/core/common/base.hpp>
#include <rollup/core/common/util.hpp>

namespace rollup {

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (bytes.size() > kAddressLength) {
        bytes = bytes.substr(bytes.size() - kAddressLength);
    }
    std::copy_n(bytes.data(), bytes.size(), out.bytes + kAddressLength - bytes.size());
    return out;
}

evmc::address hex_to_address(std::string_view hex, bool return_zero_on_err) {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kAddressLength) {
        if (return_zero_on_err) {
            return evmc::address{};
        }
        throw std::invalid_argument{"invalid address: " + std::string{hex}};
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(byte_view(address.bytes), /*with_prefix=*/true);
}

}  // namespace rollup

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << rollup::address_to_hex(address);
    return out;
}

}  // namespace evmc
