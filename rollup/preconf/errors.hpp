// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace rollup::preconf {

//! \brief Reasons for which the sync status gate refuses speculative execution
enum class GateError : uint8_t {
    kEnvNil,
    kSyncStatusNil,
    kSyncStatusNotOk,
    kEnvTooOld,
    kCurrentL1BlockTooOld,
    kHeadL1BlockTooOld,
    kL1DistanceTooLarge,
    kEnvBehindTarget,
    kEnvTooFarAhead,
};

std::string_view to_string(GateError error);

//! \brief Failure kinds reported by the transaction processor
enum class ExecutionErrorCode : uint8_t {
    kNonceTooLow,
    kNonceTooHigh,
    kGasLimitReached,  // block gas pool exhausted
    kIntrinsicGas,
    kInsufficientFunds,
    kExecutionFailed,
};

struct ExecutionError {
    ExecutionErrorCode code{ExecutionErrorCode::kExecutionFailed};
    std::string message;

    std::string to_string() const;

    friend bool operator==(const ExecutionError&, const ExecutionError&) = default;
};

using PreconfError = std::variant<GateError, ExecutionError>;

std::string to_string(const PreconfError& error);

std::ostream& operator<<(std::ostream& out, GateError error);
std::ostream& operator<<(std::ostream& out, const ExecutionError& error);

}  // namespace rollup::preconf
