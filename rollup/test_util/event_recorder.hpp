// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

#include <boost/signals2/connection.hpp>

#include <rollup/txpool/preconf_pool.hpp>

namespace rollup::test_util {

//! \brief Collects the verdicts published by a PreconfTxPool, which are emitted on its timer thread
class EventRecorder {
  public:
    explicit EventRecorder(txpool::PreconfTxPool& pool)
        : connection_{pool.signal_preconf_event.connect([this](const preconf::PreconfTxEvent& event) {
              {
                  std::scoped_lock lock{mutex_};
                  events_.push_back(event);
              }
              cv_.notify_all();
          })} {}

    //! \brief Waits until at least \p count events have been recorded or \p timeout expires
    //! \return the events recorded so far
    std::vector<preconf::PreconfTxEvent> wait_for(size_t count,
                                                  std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
        std::unique_lock lock{mutex_};
        cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
        return events_;
    }

    std::vector<preconf::PreconfTxEvent> events() {
        std::scoped_lock lock{mutex_};
        return events_;
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<preconf::PreconfTxEvent> events_;
    boost::signals2::scoped_connection connection_;
};

}  // namespace rollup::test_util
