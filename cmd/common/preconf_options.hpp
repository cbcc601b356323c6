// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <rollup/preconf/miner_config.hpp>
#include <rollup/preconf/txpool_config.hpp>
#include <rollup/txpool/journal.hpp>

namespace rollup::cmd::common {

//! \brief Set up the --preconf.* options selecting and timing out preconfirmation transactions
void add_preconf_options(CLI::App& cli, preconf::TxPoolConfig& config);

//! \brief Set up the --miner.preconf.* options of the speculative executor and its gate
void add_miner_preconf_options(CLI::App& cli, preconf::MinerConfig& config);

//! \brief Set up the --preconf.journal.* options
void add_preconf_journal_options(CLI::App& cli, txpool::JournalSettings& settings);

}  // namespace rollup::cmd::common
