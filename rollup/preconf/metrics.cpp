// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "metrics.hpp"

#include <magic_enum.hpp>

namespace rollup::preconf {

void CountingPreconfMetrics::on_sync_status(const SyncStatus* status, bool ok) {
    if (status) {
        op_node_l1_current_ = status->current_l1.number;
        op_node_l1_head_ = status->head_l1.number;
        op_node_l2_unsafe_ = status->unsafe_l2.number;
        op_node_engine_sync_target_ = status->engine_sync_target.number;
    }
    op_node_sync_status_ok_ = ok;
}

void CountingPreconfMetrics::on_l1_deposits(bool ok, size_t count) {
    l1_client_ok_ = ok;
    l1_deposit_count_ = count;
}

void CountingPreconfMetrics::on_env_block_number(BlockNum number) {
    env_block_number_ = number;
}

void CountingPreconfMetrics::on_pending_delta(int64_t delta) {
    pending_ += delta;
}

void CountingPreconfMetrics::on_preconf_success() {
    ++success_;
}

void CountingPreconfMetrics::on_preconf_failure() {
    ++failure_;
}

void CountingPreconfMetrics::on_journal_size(size_t count) {
    journal_size_ = count;
}

void CountingPreconfMetrics::observe(PreconfTimer timer, std::chrono::nanoseconds duration) {
    auto& t = timers_[static_cast<size_t>(timer)];
    const int64_t ns{duration.count()};
    ++t.count;
    t.total_ns += ns;
    int64_t current_max{t.max_ns.load()};
    while (ns > current_max && !t.max_ns.compare_exchange_weak(current_max, ns)) {
    }
}

CountingPreconfMetrics::Snapshot CountingPreconfMetrics::snapshot() const {
    Snapshot s;
    s.op_node_l1_current = op_node_l1_current_;
    s.op_node_l1_head = op_node_l1_head_;
    s.op_node_l2_unsafe = op_node_l2_unsafe_;
    s.op_node_engine_sync_target = op_node_engine_sync_target_;
    s.op_node_sync_status_ok = op_node_sync_status_ok_;
    s.l1_client_ok = l1_client_ok_;
    s.l1_deposit_count = l1_deposit_count_;
    s.env_block_number = env_block_number_;
    s.pending = pending_;
    s.success = success_;
    s.failure = failure_;
    s.journal_size = journal_size_;
    for (size_t i{0}; i < kPreconfTimerCount; ++i) {
        s.timers[i].count = timers_[i].count;
        s.timers[i].total = std::chrono::nanoseconds{timers_[i].total_ns.load()};
        s.timers[i].max = std::chrono::nanoseconds{timers_[i].max_ns.load()};
    }
    return s;
}

log::Args CountingPreconfMetrics::to_log_args() const {
    const auto s{snapshot()};
    log::Args args{
        "l1.current", std::to_string(s.op_node_l1_current),
        "l1.head", std::to_string(s.op_node_l1_head),
        "l2.unsafe", std::to_string(s.op_node_l2_unsafe),
        "sync_target", std::to_string(s.op_node_engine_sync_target),
        "sync_ok", s.op_node_sync_status_ok ? "1" : "0",
        "l1_client_ok", s.l1_client_ok ? "1" : "0",
        "deposits", std::to_string(s.l1_deposit_count),
        "env", std::to_string(s.env_block_number),
        "pending", std::to_string(s.pending),
        "success", std::to_string(s.success),
        "failure", std::to_string(s.failure),
    };
    for (size_t i{0}; i < kPreconfTimerCount; ++i) {
        const auto& timer{s.timers[i]};
        if (timer.count == 0) continue;
        const auto avg_us = timer.total.count() / static_cast<int64_t>(timer.count) / 1000;
        args.emplace_back(std::string{magic_enum::enum_name(static_cast<PreconfTimer>(i))} + ".avg_us");
        args.emplace_back(std::to_string(avg_us));
    }
    return args;
}

}  // namespace rollup::preconf
