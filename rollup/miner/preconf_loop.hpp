// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/signals2/connection.hpp>

#include <rollup/infra/concurrency/thread_safe_queue.hpp>
#include <rollup/infra/concurrency/worker.hpp>
#include <rollup/miner/preconf_checker.hpp>
#include <rollup/preconf/request.hpp>
#include <rollup/txpool/preconf_pool.hpp>

namespace rollup::miner {

//! \brief Builder side worker serving the preconfirmation requests published by the intake, one at a time
class PreconfLoop : public Worker {
  public:
    PreconfLoop(PreconfChecker& checker, txpool::PreconfTxPool& preconf_pool);
    ~PreconfLoop() override;

    //! \brief Queues a request, requests published by the pool are queued automatically
    void submit(preconf::PreconfRequestPtr request);

    //! \brief Serves a single request on the calling thread
    void process(const preconf::PreconfRequestPtr& request);

    size_t queued() const { return requests_.size(); }

  private:
    void work() final;

    PreconfChecker& checker_;
    txpool::PreconfTxPool& preconf_pool_;
    ThreadSafeQueue<preconf::PreconfRequestPtr> requests_;
    boost::signals2::scoped_connection request_connection_;
};

}  // namespace rollup::miner
