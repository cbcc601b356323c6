// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_pool.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>
#include <rollup/infra/common/log.hpp>

namespace rollup::txpool {

using preconf::PreconfStatus;

//! Verdict still expected for a published request
struct PreconfTxPool::Waiter {
    Waiter(boost::asio::io_context& ioc, TransactionPtr transaction, preconf::PreconfStatusCellPtr status_cell)
        : tx{std::move(transaction)}, status{std::move(status_cell)}, timer{ioc} {}

    TransactionPtr tx;
    preconf::PreconfStatusCellPtr status;
    boost::asio::steady_timer timer;
    std::chrono::steady_clock::time_point start{std::chrono::steady_clock::now()};
    bool resolved{false};  // accessed only on the timer thread
};

PreconfTxPool::PreconfTxPool(preconf::TxPoolConfig config, TxPool& pool, preconf::PreconfMetrics& metrics)
    : config_{std::move(config)},
      pool_{pool},
      metrics_{metrics},
      registry_{metrics},
      work_guard_{boost::asio::make_work_guard(ioc_)} {
    timer_thread_ = std::thread{[this]() {
        log::set_thread_name("preconf-pool");
        ioc_.run();
    }};
    ROLLUP_INFO << "PreconfTxPool: " << config_.to_string();
}

PreconfTxPool::~PreconfTxPool() {
    work_guard_.reset();
    ioc_.stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void PreconfTxPool::add(const Transactions& txs, bool local) {
    pool_.add(txs, local);
    for (const auto& tx : txs) {
        if (!config_.is_preconf_tx(tx->from, tx->to)) {
            ROLLUP_TRACE << "PreconfTxPool: not a preconf tx hash=" << tx->hash;
            continue;
        }
        const auto status{registry_.status(tx->hash)};
        if (status == PreconfStatus::kTimeout) {
            // Timed out preconfirmations resubmitted by the user get a new chance
            ROLLUP_DEBUG << "PreconfTxPool: recovering timed out preconf tx hash=" << tx->hash;
            registry_.remove(tx->hash);
        } else if (status) {
            ROLLUP_TRACE << "PreconfTxPool: preconf tx already known hash=" << tx->hash;
            continue;
        }
        handle_preconf_tx(tx);
    }
}

void PreconfTxPool::preconf_ready() {
    if (!preconf_ready_.exchange(true)) {
        log::Info("preconf ready");
    }
}

void PreconfTxPool::handle_preconf_tx(const TransactionPtr& tx) {
    std::unique_lock intake_lock{intake_mutex_};
    registry_.add(tx->from, tx);

    if (!preconf_ready_) {
        // Only successful preconfirmations are journaled, hence restored
        registry_.set_status(tx->hash, PreconfStatus::kSuccess);
        ROLLUP_DEBUG << "PreconfTxPool: handle preconf tx from journal hash=" << tx->hash;
        return;
    }

    auto request_and_channel{preconf::make_preconf_request(tx, ioc_.get_executor())};
    const auto request{std::move(request_and_channel.first)};
    const auto result_channel{std::move(request_and_channel.second)};
    auto waiter{std::make_shared<Waiter>(ioc_, tx, request->status)};

    // Arming is posted first, so that the timer exists before any result handler runs
    boost::asio::post(ioc_, [this, waiter, result_channel]() {
        waiter->timer.expires_after(config_.preconf_timeout);
        waiter->timer.async_wait([this, waiter, result_channel](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            // Results coming later are rejected by the channel
            result_channel->close();
            on_timeout(waiter);
        });
    });
    result_channel->on_ready([this, waiter](std::optional<preconf::PreconfResult> result) {
        on_result(waiter, std::move(result));
    });

    signal_preconf_request(request);
    ROLLUP_DEBUG << "PreconfTxPool: sent preconf tx request hash=" << tx->hash;
}

void PreconfTxPool::on_result(const WaiterPtr& waiter, std::optional<preconf::PreconfResult> result) {
    // A channel closed empty means the request was dropped: the timer decides
    if (!result || waiter->resolved) return;
    waiter->resolved = true;
    waiter->timer.cancel();

    ROLLUP_TRACE << "PreconfTxPool: received preconf tx response hash=" << waiter->tx->hash << " duration="
                 << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - waiter->start).count() << "ms";

    preconf::PreconfTxEvent event{.tx_hash = waiter->tx->hash};
    if (result->error) {
        event.status = PreconfStatus::kFailed;
        event.reason = preconf::to_string(*result->error);
    } else {
        event.status = PreconfStatus::kSuccess;
    }
    if (result->receipt) {
        if (result->receipt->success) {
            event.status = PreconfStatus::kSuccess;
            event.logs = result->receipt->logs;
        } else {
            event.status = PreconfStatus::kFailed;
            event.reason = "execution reverted";
        }
        event.predicted_l2_block_number = result->receipt->block_num;
    }
    publish(waiter, event);
}

void PreconfTxPool::on_timeout(const WaiterPtr& waiter) {
    if (waiter->resolved) return;
    waiter->resolved = true;

    preconf::PreconfTxEvent event{.tx_hash = waiter->tx->hash};
    if (waiter->status->transition(PreconfStatus::kWaiting, PreconfStatus::kTimeout)) {
        const auto elapsed{std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - waiter->start)};
        event.status = PreconfStatus::kTimeout;
        event.reason = "preconf timeout, over " + std::to_string(elapsed.count()) + "ms timeout";
        registry_.set_status(waiter->tx->hash, PreconfStatus::kTimeout);
    } else {
        event.status = waiter->status->load();
    }
    publish(waiter, event);
}

void PreconfTxPool::publish(const WaiterPtr& waiter, const preconf::PreconfTxEvent& event) {
    metrics_.observe(preconf::PreconfTimer::kTxPoolHandle, std::chrono::steady_clock::now() - waiter->start);
    if (event.status == PreconfStatus::kSuccess) {
        metrics_.on_preconf_success();
        ROLLUP_TRACE << "PreconfTxPool: preconf success hash=" << event.tx_hash;
    } else {
        metrics_.on_preconf_failure();
        log::Warning("preconf failure", {"tx", to_hex(event.tx_hash, true), "nonce", std::to_string(waiter->tx->nonce),
                                         "reason", event.reason});
    }
    signal_preconf_event(event);
}

Transactions PreconfTxPool::pending_preconf_txs(PendingMap& pending) {
    preconf::ScopedPreconfTimer timer{metrics_, preconf::PreconfTimer::kTxPoolFilter};

    for (const auto& [from, txs] : pending) {
        if (!config_.is_preconf_tx_from(from)) continue;
        for (const auto& tx : txs) {
            if (config_.is_preconf_tx(from, tx->to) && !registry_.contains(tx->hash)) {
                // It will be sealed like an ordinary transaction
                log::Error("Missing preconf tx in preconf registry", {"tx", to_hex(tx->hash, true), "from", address_to_hex(from),
                                                                      "nonce", std::to_string(tx->nonce)});
            }
        }
    }

    Transactions preconf_txs;
    for (const auto& entry : registry_.tx_entries()) {
        const auto pending_it{pending.find(entry.from)};
        if (pending_it == pending.end() || pending_it->second.empty()) {
            log::Error("Missing preconf tx in pending transactions", {"tx", to_hex(entry.tx->hash, true)});
            registry_.remove(entry.tx->hash);
            continue;
        }
        auto& sender_txs{pending_it->second};
        std::erase_if(sender_txs, [&](const auto& tx) { return tx->hash == entry.tx->hash; });
        if (sender_txs.empty()) {
            pending.erase(pending_it);
        }
        // Failed preconfirmations are sealed as well
        if (entry.status == PreconfStatus::kSuccess || entry.status == PreconfStatus::kFailed) {
            preconf_txs.push_back(entry.tx);
        }
    }

    for (const auto& entry : registry_.clean_timeout()) {
        pool_.remove(entry.tx->hash);
    }
    return preconf_txs;
}

void PreconfTxPool::set_preconf_tx_status(const evmc::bytes32& hash, PreconfStatus status) {
    registry_.set_status(hash, status);
}

void PreconfTxPool::remove_sealed(const Transactions& sealed) {
    for (const auto& tx : sealed) {
        registry_.remove(tx->hash);
    }
}

Transactions PreconfTxPool::preconf_txs(PreconfStatus status) const {
    Transactions txs;
    for (const auto& entry : registry_.tx_entries()) {
        if (entry.status == status) {
            txs.push_back(entry.tx);
        }
    }
    return txs;
}

}  // namespace rollup::txpool
