// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "txpool_config.hpp"

#include <algorithm>
#include <sstream>

#include <rollup/core/types/address.hpp>

namespace rollup::preconf {

bool TxPoolConfig::is_preconf_tx_from(const evmc::address& from) const {
    if (all_preconfs) {
        return true;
    }
    return std::ranges::find(from_preconfs, from) != from_preconfs.end();
}

bool TxPoolConfig::is_preconf_tx(const std::optional<evmc::address>& from,
                                 const std::optional<evmc::address>& to) const {
    if (all_preconfs) {
        return true;
    }
    if (!from || !to) {
        return false;
    }
    if (std::ranges::find(from_preconfs, *from) == from_preconfs.end()) {
        return false;
    }
    return std::ranges::find(to_preconfs, *to) != to_preconfs.end();
}

static void print_addresses(std::ostream& out, const std::vector<evmc::address>& addresses) {
    out << "[";
    for (size_t i{0}; i < addresses.size(); ++i) {
        out << (i ? " " : "") << addresses[i];
    }
    out << "]";
}

std::string TxPoolConfig::to_string() const {
    std::stringstream out;
    out << "from_preconfs: ";
    print_addresses(out, from_preconfs);
    out << " to_preconfs: ";
    print_addresses(out, to_preconfs);
    out << " all_preconfs: " << std::boolalpha << all_preconfs
        << " preconf_timeout: " << preconf_timeout.count() << "ms";
    return out.str();
}

}  // namespace rollup::preconf
