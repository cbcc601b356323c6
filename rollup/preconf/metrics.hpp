// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <rollup/core/common/base.hpp>
#include <rollup/infra/common/log.hpp>
#include <rollup/preconf/sync_status.hpp>

namespace rollup::preconf {

//! \brief Processing phases whose duration is tracked
enum class PreconfTimer : uint8_t {
    kTxPoolHandle,   // intake waiting for a verdict
    kTxPoolForward,  // registry nonce pruning
    kTxPoolFilter,   // registry/pending split at block-fill time
    kMinerExecute,   // speculative execution
};

inline constexpr size_t kPreconfTimerCount{4};

//! \brief Sink receiving the observations of the preconfirmation engine
class PreconfMetrics {
  public:
    virtual ~PreconfMetrics() = default;

    //! Rollup node progress after each poll, \p status is null until the first accepted update
    virtual void on_sync_status(const SyncStatus* status, bool ok) = 0;

    //! Outcome of the last deposit window refresh
    virtual void on_l1_deposits(bool ok, size_t count) = 0;

    //! Block number of the environment speculative execution runs against
    virtual void on_env_block_number(BlockNum number) = 0;

    //! Change in the number of registered preconfirmation transactions
    virtual void on_pending_delta(int64_t delta) = 0;

    virtual void on_preconf_success() = 0;
    virtual void on_preconf_failure() = 0;

    //! Number of transactions tracked by the durability journal
    virtual void on_journal_size(size_t count) = 0;

    virtual void observe(PreconfTimer timer, std::chrono::nanoseconds duration) = 0;
};

//! \brief Measures the lifetime of the scope into the given timer
class ScopedPreconfTimer {
  public:
    ScopedPreconfTimer(PreconfMetrics& metrics, PreconfTimer timer)
        : metrics_{metrics}, timer_{timer}, start_{std::chrono::steady_clock::now()} {}
    ~ScopedPreconfTimer() { metrics_.observe(timer_, std::chrono::steady_clock::now() - start_); }

    ScopedPreconfTimer(const ScopedPreconfTimer&) = delete;
    ScopedPreconfTimer& operator=(const ScopedPreconfTimer&) = delete;

  private:
    PreconfMetrics& metrics_;
    PreconfTimer timer_;
    std::chrono::steady_clock::time_point start_;
};

//! \brief In-process implementation keeping gauges, meters and timer totals in atomics
class CountingPreconfMetrics : public PreconfMetrics {
  public:
    struct TimerSnapshot {
        uint64_t count{0};
        std::chrono::nanoseconds total{0};
        std::chrono::nanoseconds max{0};
    };

    struct Snapshot {
        BlockNum op_node_l1_current{0};
        BlockNum op_node_l1_head{0};
        BlockNum op_node_l2_unsafe{0};
        BlockNum op_node_engine_sync_target{0};
        bool op_node_sync_status_ok{false};
        bool l1_client_ok{false};
        size_t l1_deposit_count{0};
        BlockNum env_block_number{0};
        int64_t pending{0};
        uint64_t success{0};
        uint64_t failure{0};
        size_t journal_size{0};
        std::array<TimerSnapshot, kPreconfTimerCount> timers{};
    };

    void on_sync_status(const SyncStatus* status, bool ok) override;
    void on_l1_deposits(bool ok, size_t count) override;
    void on_env_block_number(BlockNum number) override;
    void on_pending_delta(int64_t delta) override;
    void on_preconf_success() override;
    void on_preconf_failure() override;
    void on_journal_size(size_t count) override;
    void observe(PreconfTimer timer, std::chrono::nanoseconds duration) override;

    Snapshot snapshot() const;

    //! \brief Renders the current values as key/value pairs for log lines
    log::Args to_log_args() const;

  private:
    struct Timer {
        std::atomic_uint64_t count{0};
        std::atomic_int64_t total_ns{0};
        std::atomic_int64_t max_ns{0};
    };

    std::atomic_uint64_t op_node_l1_current_{0};
    std::atomic_uint64_t op_node_l1_head_{0};
    std::atomic_uint64_t op_node_l2_unsafe_{0};
    std::atomic_uint64_t op_node_engine_sync_target_{0};
    std::atomic_bool op_node_sync_status_ok_{false};
    std::atomic_bool l1_client_ok_{false};
    std::atomic_size_t l1_deposit_count_{0};
    std::atomic_uint64_t env_block_number_{0};
    std::atomic_int64_t pending_{0};
    std::atomic_uint64_t success_{0};
    std::atomic_uint64_t failure_{0};
    std::atomic_size_t journal_size_{0};
    std::array<Timer, kPreconfTimerCount> timers_;
};

}  // namespace rollup::preconf
