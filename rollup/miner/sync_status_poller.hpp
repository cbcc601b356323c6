// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>

#include <rollup/infra/concurrency/worker.hpp>
#include <rollup/l1/sources.hpp>
#include <rollup/miner/preconf_checker.hpp>
#include <rollup/preconf/metrics.hpp>

namespace rollup::miner {

//! \brief Feeds the checker with the rollup node sync status at regular intervals
//! \details The worker exits right away if the checker is disabled in the miner configuration
class SyncStatusPoller : public Worker {
  public:
    SyncStatusPoller(l1::SyncStatusSource& source, PreconfChecker& checker, preconf::PreconfMetrics& metrics,
                     std::chrono::milliseconds interval);
    ~SyncStatusPoller() override;

    //! \brief Polls once and publishes the status metrics
    //! \return true if a status has been received
    bool poll();

    uint64_t poll_count() const { return poll_count_.load(); }
    uint64_t failure_count() const { return failure_count_.load(); }

  private:
    void work() final;

    l1::SyncStatusSource& source_;
    PreconfChecker& checker_;
    preconf::PreconfMetrics& metrics_;
    std::chrono::milliseconds interval_;
    std::atomic_uint64_t poll_count_{0};
    std::atomic_uint64_t failure_count_{0};
};

}  // namespace rollup::miner
