// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "quantity.hpp"

#include <sstream>
#include <stdexcept>

#include <rollup/core/common/util.hpp>

namespace rollup::preconf {

std::string to_quantity(uint64_t value) {
    std::stringstream out;
    out << "0x" << std::hex << value;
    return out.str();
}

uint64_t from_quantity(const nlohmann::json& json) {
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    if (json.is_number_integer()) {
        const auto value{json.get<int64_t>()};
        if (value < 0) {
            throw std::invalid_argument{"quantity: negative value " + std::to_string(value)};
        }
        return static_cast<uint64_t>(value);
    }
    if (!json.is_string()) {
        throw std::invalid_argument{"quantity: unexpected JSON type " + std::string{json.type_name()}};
    }
    const auto& str = json.get_ref<const std::string&>();
    // 0x prefix plus at most 16 hex digits
    if (str.size() < 3 || str.size() > 18 || !(str.starts_with("0x") || str.starts_with("0X"))) {
        throw std::invalid_argument{"quantity: invalid hex " + str};
    }
    uint64_t value{0};
    for (size_t i{2}; i < str.size(); ++i) {
        const auto digit{decode_hex_digit(str[i])};
        if (!digit) {
            throw std::invalid_argument{"quantity: invalid hex " + str};
        }
        value = (value << 4) | *digit;
    }
    return value;
}

}  // namespace rollup::preconf
