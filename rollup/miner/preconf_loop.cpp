// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "preconf_loop.hpp"

#include <chrono>
#include <variant>

#include <rollup/core/common/util.hpp>
#include <rollup/infra/common/log.hpp>

namespace rollup::miner {

using preconf::PreconfStatus;

PreconfLoop::PreconfLoop(PreconfChecker& checker, txpool::PreconfTxPool& preconf_pool)
    : Worker{"preconf-loop"}, checker_{checker}, preconf_pool_{preconf_pool} {
    request_connection_ = preconf_pool_.signal_preconf_request.connect(
        [this](const preconf::PreconfRequestPtr& request) { submit(request); });
}

PreconfLoop::~PreconfLoop() {
    request_connection_.disconnect();
    stop(/*wait=*/true);
}

void PreconfLoop::submit(preconf::PreconfRequestPtr request) {
    requests_.push(std::move(request));
}

void PreconfLoop::work() {
    while (!is_stopping()) {
        const auto request{requests_.pop_for(std::chrono::milliseconds{100})};
        if (!request) {
            continue;
        }
        process(*request);
    }
}

void PreconfLoop::process(const preconf::PreconfRequestPtr& request) {
    const auto start{std::chrono::steady_clock::now()};
    const auto& tx_hash{request->tx->hash};
    ROLLUP_DEBUG << "worker received preconf tx request tx=" << tx_hash;

    if (request->status->load() == PreconfStatus::kTimeout) {
        log::Warning("preconf tx request timeout", {"tx", to_hex(tx_hash, true)});
        request->completion.abandon();
        return;
    }

    auto result{checker_.preconf(request->tx)};
    if (!result) {
        ROLLUP_TRACE << "preconf failed tx=" << tx_hash << " error=" << preconf::to_string(result.error());
        if (std::holds_alternative<preconf::GateError>(result.error())) {
            // The intake turns the missing verdict into a timeout
            log::Warning("preconf is temporarily not available, tx will be handled as timeout",
                         {"tx", to_hex(tx_hash, true), "reason", preconf::to_string(result.error())});
            request->completion.abandon();
            return;
        }
    }
    ROLLUP_TRACE << "worker preconf tx executed tx=" << tx_hash << " duration="
                 << std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count() << "us";

    // The registry must know the verdict before the intake does, or a successful tx could miss its block
    const bool success{result && result->success};
    request->status->transition(PreconfStatus::kWaiting, success ? PreconfStatus::kSuccess : PreconfStatus::kFailed);
    const auto status{request->status->load()};
    preconf_pool_.set_preconf_tx_status(tx_hash, status);

    if (status == PreconfStatus::kTimeout) {
        const bool reverted{checker_.revert_tx(tx_hash)};
        log::Warning("preconf tx request timeout after preconf executed",
                     {"tx", to_hex(tx_hash, true), "reverted", reverted ? "true" : "false"});
        request->completion.abandon();
        return;
    }

    preconf::PreconfResult response;
    if (result) {
        response.receipt = std::move(*result);
    } else {
        response.error = std::move(result.error());
    }
    if (request->completion.complete(std::move(response))) {
        ROLLUP_DEBUG << "worker sent preconf tx response tx=" << tx_hash;
    } else {
        log::Warning("preconf tx response not delivered, result channel closed", {"tx", to_hex(tx_hash, true)});
    }
}

}  // namespace rollup::miner
