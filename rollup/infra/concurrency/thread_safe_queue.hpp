// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace rollup {

//! \brief Unbounded FIFO queue handing work items from any number of producers to a polling consumer
template <typename T>
class ThreadSafeQueue {
  public:
    void push(T item) {
        {
            std::scoped_lock lock{mutex_};
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
    }

    size_t size() const {
        std::scoped_lock lock{mutex_};
        return queue_.size();
    }

    //! \brief Waits up to \p timeout for the oldest item
    //! \return the item or std::nullopt if the queue stayed empty
    template <class Rep, class Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock{mutex_};
        if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        std::optional<T> item{std::move(queue_.front())};
        queue_.pop_front();
        return item;
    }

  private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
};

}  // namespace rollup
