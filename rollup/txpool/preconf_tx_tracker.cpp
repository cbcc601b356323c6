// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_tx_tracker.hpp"

#include <chrono>
#include <stdexcept>

#include <rollup/core/common/util.hpp>
#include <rollup/infra/common/log.hpp>

namespace rollup::txpool {

PreconfTxTracker::PreconfTxTracker(JournalSettings settings, PreconfTxPool& preconf_pool,
                                   preconf::PreconfMetrics& metrics)
    : Worker{"preconf-track"},
      settings_{std::move(settings)},
      preconf_pool_{preconf_pool},
      metrics_{metrics},
      journal_{settings_.path} {}

PreconfTxTracker::~PreconfTxTracker() {
    stop(/*wait=*/true);
}

void PreconfTxTracker::track(const TransactionPtr& tx) {
    track_all({tx}, /*clean=*/false);
}

void PreconfTxTracker::track_all(const Transactions& txs, bool clean) {
    std::scoped_lock lock{mutex_};
    if (clean) {
        tracked_.clear();
    }
    for (const auto& tx : txs) {
        if (!tracked_.emplace(tx->hash, tx).second) {
            continue;
        }
        try {
            journal_.insert(*tx);
            ROLLUP_TRACE << "PreconfTxTracker: inserted transaction into journal tx=" << tx->hash;
        } catch (const std::runtime_error& e) {
            log::Error("PreconfTxTracker: failed to insert transaction into journal",
                       {"tx", to_hex(tx->hash, true), "error", e.what()});
        }
    }
    metrics_.on_journal_size(tracked_.size());
}

size_t PreconfTxTracker::size() const {
    std::scoped_lock lock{mutex_};
    return tracked_.size();
}

void PreconfTxTracker::work() {
    if (settings_.path.empty()) {
        log::Info("PreconfTxTracker: journal disabled");
        return;
    }

    const auto start{std::chrono::steady_clock::now()};
    size_t restored{0};
    log::Info("PreconfTxTracker: loading transactions from journal", {"path", settings_.path.string()});
    try {
        journal_.load([&](const Transactions& txs) {
            preconf_pool_.add(txs, /*local=*/true);
            restored += txs.size();
        });
    } catch (const std::runtime_error& e) {
        log::Error("PreconfTxTracker: transaction journal loading failed", {"error", e.what()});
        return;
    }
    log::Info("PreconfTxTracker: restored transactions", {"count", std::to_string(restored),
                                                          "duration", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count()) + "ms"});

    // Restored transactions are registered as successful: rotation keeps them and opens the journal for writing
    rejournal();

    event_connection_ = preconf_pool_.signal_preconf_event.connect([this](const preconf::PreconfTxEvent& event) {
        if (event.status != preconf::PreconfStatus::kSuccess) return;
        if (const auto tx{preconf_pool_.registry().get(event.tx_hash)}) {
            track(tx);
        }
    });

    auto next_rotation{std::chrono::steady_clock::now() + settings_.rotation_interval};
    while (wait_for_kick(std::chrono::duration_cast<std::chrono::milliseconds>(next_rotation - std::chrono::steady_clock::now()))) {
        if (std::chrono::steady_clock::now() >= next_rotation) {
            rejournal();
            next_rotation = std::chrono::steady_clock::now() + settings_.rotation_interval;
        }
    }

    event_connection_.disconnect();
    rejournal();
    journal_.close();
    log::Info("PreconfTxTracker: stopped");
}

void PreconfTxTracker::rejournal() {
    const auto start{std::chrono::steady_clock::now()};
    const auto preconf_txs{preconf_pool_.preconf_txs(preconf::PreconfStatus::kSuccess)};

    std::scoped_lock lock{mutex_};
    tracked_.clear();
    for (const auto& tx : preconf_txs) {
        tracked_.emplace(tx->hash, tx);
    }
    metrics_.on_journal_size(tracked_.size());
    try {
        journal_.rotate(preconf_txs);
        ROLLUP_DEBUG << "PreconfTxTracker: transaction journal rotated count=" << preconf_txs.size() << " duration="
                     << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count() << "ms";
    } catch (const std::runtime_error& e) {
        log::Error("PreconfTxTracker: transaction journal rotation failed", {"error", e.what()});
    }
}

}  // namespace rollup::txpool
