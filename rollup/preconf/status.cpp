// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "status.hpp"

#include <algorithm>
#include <cctype>

#include <magic_enum.hpp>

namespace rollup::preconf {

std::string to_string(PreconfStatus status) {
    auto name{magic_enum::enum_name(status)};
    if (name.empty()) {
        return "unknown";
    }
    name.remove_prefix(1);  // k
    std::string result{name};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::ostream& operator<<(std::ostream& out, PreconfStatus status) {
    out << to_string(status);
    return out;
}

}  // namespace rollup::preconf
