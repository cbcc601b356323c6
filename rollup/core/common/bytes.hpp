// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include <evmc/bytes.hpp>

namespace rollup {

using Bytes = evmc::bytes;
using ByteView = evmc::bytes_view;

//! \brief View over the raw payload of a fixed-size value such as an address, a hash or a log topic
template <size_t N>
constexpr ByteView byte_view(const uint8_t (&payload)[N]) noexcept {
    return ByteView{payload, N};
}

}  // namespace rollup
