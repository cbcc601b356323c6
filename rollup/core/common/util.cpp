// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <stdexcept>

namespace rollup {

ByteView zeroless_view(ByteView data) {
    const auto is_zero_byte = [](const auto& b) { return b == 0x0; };
    const auto first_nonzero_byte_it{std::ranges::find_if_not(data, is_zero_byte)};
    return data.substr(static_cast<size_t>(std::distance(data.begin(), first_nonzero_byte_it)));
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (hex.length() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos{hex.length() & 1};
    Bytes out((hex.length() + pos) / 2, '\0');
    auto dst{out.begin()};
    if (pos) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) return std::nullopt;
        *dst++ = *lo;
        hex.remove_prefix(1);
    }
    for (size_t i{0}; i < hex.length(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (bytes.size() > kHashLength) {
        bytes = bytes.substr(bytes.size() - kHashLength);
    }
    std::copy_n(bytes.data(), bytes.size(), out.bytes + kHashLength - bytes.size());
    return out;
}

evmc::bytes32 hex_to_bytes32(std::string_view hex) {
    const auto bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kHashLength) {
        throw std::invalid_argument{"invalid hash: " + std::string{hex}};
    }
    return to_bytes32(*bytes);
}

}  // namespace rollup

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& hash) {
    out << rollup::to_hex(hash, /*with_prefix=*/true);
    return out;
}

}  // namespace evmc
