// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_options.hpp"

#include <string>
#include <vector>

#include <rollup/core/types/address.hpp>
#include <rollup/infra/cli/common.hpp>

namespace rollup::cmd::common {

//! CLI11 validator for 20-byte hex addresses
struct AddressValidator : public CLI::Validator {
    AddressValidator() {
        description("20-byte hex address");
        func_ = [](const std::string& value) -> std::string {
            try {
                hex_to_address(value);
            } catch (const std::invalid_argument& ex) {
                return ex.what();
            }
            return {};
        };
    }
};

static void add_option_addresses(CLI::App& cli, const std::string& name, std::vector<evmc::address>& addresses,
                                 const std::string& description) {
    cli.add_option_function<std::vector<std::string>>(
           name,
           [&addresses](const std::vector<std::string>& values) {
               addresses.clear();
               for (const auto& value : values) {
                   addresses.push_back(hex_to_address(value));
               }
           },
           description)
        ->delimiter(',')
        ->check(AddressValidator{});
}

void add_preconf_options(CLI::App& cli, preconf::TxPoolConfig& config) {
    auto& preconf_opts = *cli.add_option_group("Preconf", "Preconfirmation intake options");
    add_option_addresses(preconf_opts, "--preconf.from", config.from_preconfs,
                         "Comma-separated senders whose transactions are preconfirmed");
    add_option_addresses(preconf_opts, "--preconf.to", config.to_preconfs,
                         "Comma-separated recipients of preconfirmed transactions");
    preconf_opts.add_flag("--preconf.all", config.all_preconfs, "Preconfirm every transaction");
    add_option_duration(preconf_opts, "--preconf.timeout", config.preconf_timeout,
                        "Max time the intake waits for a preconfirmation verdict");
}

void add_miner_preconf_options(CLI::App& cli, preconf::MinerConfig& config) {
    auto& miner_opts = *cli.add_option_group("Miner Preconf", "Speculative execution options");
    miner_opts.add_flag("--miner.preconf.checker", config.enable_preconf_checker,
                        "Enable the rollup node sync status checker");
    add_option_http_url(miner_opts, "--miner.preconf.opnode", config.optimism_node_http, "Rollup node HTTP endpoint");
    add_option_http_url(miner_opts, "--miner.preconf.l1rpc", config.l1_rpc_http, "L1 node HTTP endpoint");

    miner_opts.add_option_function<std::string>(
                  "--miner.preconf.depositaddress",
                  [&config](const std::string& value) { config.l1_deposit_address = hex_to_address(value); },
                  "L1 address emitting the TransactionDeposited logs")
        ->check(AddressValidator{})
        ->default_str(address_to_hex(config.l1_deposit_address));

    miner_opts.add_option("--miner.preconf.toleranceblock", config.tolerance_block,
                          "Base tolerance in blocks of the sync status checks")
        ->capture_default_str()
        ->check(CLI::Range(int64_t{1}, int64_t{1024}));
    miner_opts.add_option("--miner.preconf.bufferblock", config.preconf_buffer_block,
                          "Max L2 blocks the build environment may run ahead of the rollup node")
        ->capture_default_str()
        ->check(CLI::Range(uint64_t{0}, uint64_t{1024}));

    add_option_duration(miner_opts, "--miner.preconf.requesttimeout", config.request_timeout,
                        "Timeout of the requests to the rollup node and the L1 node");
    add_option_duration(miner_opts, "--miner.preconf.pollinterval", config.sync_status_poll_interval,
                        "Interval between two rollup node sync status polls");
    add_option_duration(miner_opts, "--miner.preconf.leftovertimeout", config.leftover_wait_timeout,
                        "Max wait for the preconfirmation transactions left out of a block");

    miner_opts.add_option_function<uint64_t>(
        "--miner.preconf.envtolerance",
        [&config](const uint64_t& value) { config.env_tolerance_override = std::chrono::seconds{value}; },
        "Override the max age of the build environment (seconds)");
    miner_opts.add_option_function<uint64_t>(
        "--miner.preconf.l1tolerance",
        [&config](const uint64_t& value) { config.l1_tolerance_override = std::chrono::seconds{value}; },
        "Override the max age of the current and head L1 blocks (seconds)");
    miner_opts.add_option_function<uint64_t>(
        "--miner.preconf.l1toleranceblock",
        [&config](const uint64_t& value) { config.l1_tolerance_block_override = value; },
        "Override the max distance between current and head L1 blocks");
}

void add_preconf_journal_options(CLI::App& cli, txpool::JournalSettings& settings) {
    auto& journal_opts = *cli.add_option_group("Preconf Journal", "Preconfirmation journal options");
    journal_opts.add_option("--preconf.journal", settings.path,
                            "File preconfirmed transactions are journaled into (disabled if empty)");
    add_option_duration(journal_opts, "--preconf.journal.rejournal", settings.rotation_interval,
                        "Interval between two journal rotations");
}

}  // namespace rollup::cmd::common
