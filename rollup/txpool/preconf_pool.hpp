// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/signals2/signal.hpp>

#include <rollup/core/types/transaction.hpp>
#include <rollup/preconf/event.hpp>
#include <rollup/preconf/fifo_tx_set.hpp>
#include <rollup/preconf/metrics.hpp>
#include <rollup/preconf/request.hpp>
#include <rollup/preconf/txpool_config.hpp>
#include <rollup/txpool/pool.hpp>

namespace rollup::txpool {

//! \brief Preconfirmation intake sitting on top of the general transaction pool
//! \details Transactions matching the preconfirmation policy are registered in admission order and published
//! as requests to the builder. A verdict event is then produced for each of them by whichever comes first
//! between the request result and the preconfirmation timeout. Timers run on an internal thread.
//! The pool must outlive whoever serves its requests.
class PreconfTxPool {
  public:
    PreconfTxPool(preconf::TxPoolConfig config, TxPool& pool, preconf::PreconfMetrics& metrics);
    ~PreconfTxPool();

    PreconfTxPool(const PreconfTxPool&) = delete;
    PreconfTxPool& operator=(const PreconfTxPool&) = delete;

    //! \brief Admits the transactions into the general pool, starting the preconfirmation of matching ones
    void add(const Transactions& txs, bool local);

    //! \brief Notifies that the builder can serve preconfirmation requests
    //! \details Until the first call, matching transactions are considered restored from the journal and marked
    //! successful without being executed. Every later call is a no-op.
    void preconf_ready();
    bool is_preconf_ready() const { return preconf_ready_.load(); }

    //! \brief Moves every registered transaction out of \p pending
    //! \return the registered transactions with a final verdict in admission order
    //! \details Registry entries no longer pending are dropped, timed out entries are removed from the registry
    //! and from the general pool
    Transactions pending_preconf_txs(PendingMap& pending);

    void set_preconf_tx_status(const evmc::bytes32& hash, preconf::PreconfStatus status);

    //! \brief Drops the registry entries of transactions sealed into a block
    void remove_sealed(const Transactions& sealed);

    //! \brief Drops the registry entries of \p from superseded by account nonce \p nonce
    void forward(const evmc::address& from, uint64_t nonce) { registry_.forward(from, nonce); }

    //! \return the registered transactions currently in \p status in admission order
    Transactions preconf_txs(preconf::PreconfStatus status) const;

    const preconf::FifoTxSet& registry() const { return registry_; }
    const preconf::TxPoolConfig& config() const { return config_; }

    //! Requests to be served by the builder, emitted in registration order
    boost::signals2::signal<void(const preconf::PreconfRequestPtr&)> signal_preconf_request;

    //! One verdict per published request
    boost::signals2::signal<void(const preconf::PreconfTxEvent&)> signal_preconf_event;

  private:
    struct Waiter;
    using WaiterPtr = std::shared_ptr<Waiter>;

    void handle_preconf_tx(const TransactionPtr& tx);
    void on_result(const WaiterPtr& waiter, std::optional<preconf::PreconfResult> result);
    void on_timeout(const WaiterPtr& waiter);
    void publish(const WaiterPtr& waiter, const preconf::PreconfTxEvent& event);

    preconf::TxPoolConfig config_;
    TxPool& pool_;
    preconf::PreconfMetrics& metrics_;
    preconf::FifoTxSet registry_;
    std::atomic_bool preconf_ready_{false};

    // Registration and request publication happen in the same order
    std::mutex intake_mutex_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread timer_thread_;
};

}  // namespace rollup::txpool
