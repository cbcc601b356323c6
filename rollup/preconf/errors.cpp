// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

namespace rollup::preconf {

std::string_view to_string(GateError error) {
    switch (error) {
        case GateError::kEnvNil:
            return "env is nil";
        case GateError::kSyncStatusNil:
            return "optimism sync status is nil";
        case GateError::kSyncStatusNotOk:
            return "optimism sync status is not ok";
        case GateError::kEnvTooOld:
            return "env is too old";
        case GateError::kCurrentL1BlockTooOld:
            return "current l1 block is too old";
        case GateError::kHeadL1BlockTooOld:
            return "head l1 block is too old";
        case GateError::kL1DistanceTooLarge:
            return "current l1 number and head l1 number distance is too large";
        case GateError::kEnvBehindTarget:
            return "env block number is less than engine sync target block number or unsafe l2 block number";
        case GateError::kEnvTooFarAhead:
            return "env block number and engine sync target block number distance is too large";
    }
    return "unknown gate error";
}

std::string ExecutionError::to_string() const {
    if (message.empty()) {
        return std::string{magic_enum::enum_name(code)};
    }
    return message;
}

std::string to_string(const PreconfError& error) {
    if (const auto* gate_error = std::get_if<GateError>(&error)) {
        return std::string{to_string(*gate_error)};
    }
    return std::get<ExecutionError>(error).to_string();
}

std::ostream& operator<<(std::ostream& out, GateError error) {
    out << to_string(error);
    return out;
}

std::ostream& operator<<(std::ostream& out, const ExecutionError& error) {
    out << magic_enum::enum_name(error.code) << ": " << error.message;
    return out;
}

}  // namespace rollup::preconf
