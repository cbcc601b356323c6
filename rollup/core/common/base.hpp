// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic types and constants.

#include <cstddef>
#include <cstdint>

namespace rollup {

using BlockNum = uint64_t;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// Intrinsic gas of a plain value transfer
inline constexpr uint64_t kTxGas{21'000};

}  // namespace rollup
