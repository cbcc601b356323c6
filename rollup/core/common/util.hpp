// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/common/bytes.hpp>

namespace rollup {

//! \brief Strips leftmost zeroed bytes from byte sequence
ByteView zeroless_view(ByteView data);

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Returns a string representing the hex form of provided hash
inline std::string to_hex(const evmc::bytes32& hash, bool with_prefix = false) {
    return to_hex(byte_view(hash.bytes), with_prefix);
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string, with or without 0x prefix; odd lengths are left padded
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Converts bytes to evmc::bytes32; input is cropped if longer, left padded with zeros if shorter
evmc::bytes32 to_bytes32(ByteView bytes);

//! \brief Parses a 32 bytes hash in hex form
//! \throws std::invalid_argument if the input is not a valid hash
evmc::bytes32 hex_to_bytes32(std::string_view hex);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline evmc::bytes32 keccak256_hash(ByteView view) {
    evmc::bytes32 hash;
    const auto h{keccak256(view)};
    std::copy_n(h.bytes, kHashLength, hash.bytes);
    return hash;
}

inline std::ostream& operator<<(std::ostream& out, const Bytes& bytes) {
    out << to_hex(bytes);
    return out;
}

}  // namespace rollup

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& hash);

}  // namespace evmc
