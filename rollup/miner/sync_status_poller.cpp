// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sync_status_poller.hpp"

#include <exception>

#include <rollup/infra/common/log.hpp>

namespace rollup::miner {

SyncStatusPoller::SyncStatusPoller(l1::SyncStatusSource& source, PreconfChecker& checker,
                                   preconf::PreconfMetrics& metrics, std::chrono::milliseconds interval)
    : Worker{"sync-status"}, source_{source}, checker_{checker}, metrics_{metrics}, interval_{interval} {}

SyncStatusPoller::~SyncStatusPoller() {
    stop(/*wait=*/true);
}

bool SyncStatusPoller::poll() {
    ++poll_count_;
    bool received{false};
    try {
        const auto status{source_.sync_status()};
        received = true;
        checker_.update_sync_status(status);
    } catch (const std::exception& e) {
        ++failure_count_;
        log::Error("Failed to sync optimism status", {"error", e.what()});
    }

    const auto status{checker_.sync_status()};
    metrics_.on_sync_status(status ? &*status : nullptr, checker_.is_sync_status_ok());
    return received;
}

void SyncStatusPoller::work() {
    if (!checker_.config().enable_preconf_checker) {
        log::Info("Preconf checker disabled, rollup node sync status not polled");
        return;
    }
    do {
        poll();
    } while (wait_for_kick(interval_));
}

}  // namespace rollup::miner
