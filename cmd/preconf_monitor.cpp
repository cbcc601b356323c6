// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

#include <CLI/CLI.hpp>

#include <rollup/infra/cli/common.hpp>
#include <rollup/infra/common/log.hpp>
#include <rollup/infra/concurrency/signal_handler.hpp>
#include <rollup/l1/clients.hpp>
#include <rollup/miner/preconf_checker.hpp>
#include <rollup/miner/sync_status_poller.hpp>
#include <rollup/preconf/metrics.hpp>
#include <rollup/preconf/miner_config.hpp>

#include "common/preconf_options.hpp"

using namespace rollup;

struct MonitorSettings {
    log::Settings log_settings;
    preconf::MinerConfig miner_config;
    std::chrono::milliseconds log_interval{10'000};
};

//! The monitor never lends a build environment to the checker so nothing gets executed
class NoExecutionProcessor : public execution::TransactionProcessor {
  public:
    tl::expected<Receipt, preconf::ExecutionError> apply(execution::BuildEnvironment&, const Transaction&) override {
        return tl::make_unexpected(
            preconf::ExecutionError{preconf::ExecutionErrorCode::kExecutionFailed, "no execution in monitor"});
    }
};

void parse_command_line(CLI::App& cli, int argc, char* argv[], MonitorSettings& settings) {
    using namespace rollup::cmd::common;

    add_logging_options(cli, settings.log_settings);
    add_miner_preconf_options(cli, settings.miner_config);
    add_option_duration(cli, "--log.interval", settings.log_interval, "Interval between two status reports");

    cli.parse(argc, argv);
}

void log_report(const miner::PreconfChecker& checker, const preconf::CountingPreconfMetrics& metrics) {
    const auto status{checker.sync_status()};
    const auto gate{checker.precheck_status()};
    log::Info("Sync status", {"status", status ? status->to_string() : "none",
                              "ok", checker.is_sync_status_ok() ? "true" : "false",
                              "deposits", std::to_string(checker.deposit_txs().size())});
    log::Info("Preconf gate", {"verdict", gate ? "open" : std::string{preconf::to_string(gate.error())}});
    log::Info("Preconf metrics", metrics.to_log_args());
}

int main(int argc, char* argv[]) {
    CLI::App cli("Preconfirmation gate monitor");
    cli.get_formatter()->column_width(50);

    try {
        MonitorSettings settings;
        parse_command_line(cli, argc, argv, settings);

        log::init(settings.log_settings);
        log::set_thread_name("main-thread");
        log::Info("Preconf monitor", {"config", settings.miner_config.to_string()});

        const auto& config{settings.miner_config};
        l1::OpNodeClient op_node_client{config.optimism_node_http, config.request_timeout};
        l1::L1LogClient l1_log_client{config.l1_rpc_http, config.request_timeout};

        preconf::CountingPreconfMetrics metrics;
        NoExecutionProcessor processor;
        miner::PreconfChecker checker{config, processor, l1_log_client, metrics};
        miner::SyncStatusPoller poller{op_node_client, checker, metrics, config.sync_status_poll_interval};

        SignalHandler::init();
        poller.start();
        ROLLUP_INFO << "Preconf monitor is now running";

        auto next_report{std::chrono::steady_clock::now() + settings.log_interval};
        while (!SignalHandler::signalled()) {
            if (poller.has_exception()) {
                poller.rethrow();
            }
            if (std::chrono::steady_clock::now() >= next_report) {
                log_report(checker, metrics);
                next_report += settings.log_interval;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        poller.stop(/*wait=*/true);
        ROLLUP_INFO << "Exiting preconf monitor";
        return 0;
    } catch (const CLI::ParseError& ex) {
        return cli.exit(ex);
    } catch (const std::exception& ex) {
        ROLLUP_CRIT << "Unrecoverable failure: " << ex.what();
        return -1;
    }
}
