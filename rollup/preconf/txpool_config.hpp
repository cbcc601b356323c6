// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

namespace rollup::preconf {

//! \brief Preconfirmation policy of the transaction pool
struct TxPoolConfig {
    //! Senders whose transactions are preconfirmed
    std::vector<evmc::address> from_preconfs;
    //! Recipients paired with from_preconfs
    std::vector<evmc::address> to_preconfs;
    //! Whether every transaction is preconfirmed regardless of sender and recipient
    bool all_preconfs{false};
    //! How long the intake waits for a verdict before declaring a timeout
    std::chrono::milliseconds preconf_timeout{1000};

    //! \brief Whether \p from is a preconfirmation sender
    bool is_preconf_tx_from(const evmc::address& from) const;

    //! \brief Whether a transaction from \p from to \p to must be preconfirmed
    //! \details Contract creations (no recipient) are never preconfirmed unless all_preconfs is set
    bool is_preconf_tx(const std::optional<evmc::address>& from, const std::optional<evmc::address>& to) const;

    std::string to_string() const;
};

}  // namespace rollup::preconf
