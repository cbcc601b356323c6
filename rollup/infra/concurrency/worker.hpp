// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/signals2/signal.hpp>

namespace rollup {

//! \brief A named background thread running the work() loop of derived classes
class Worker {
  public:
    enum class State {
        kStopped,
        kStarting,
        kStarted,
        kKickWaiting,
        kStopping
    };

    explicit Worker(std::string name) : name_{std::move(name)} {}
    virtual ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    //! \brief Starts the underlying thread, by default waiting for it to be running
    void start(bool wait = true);

    //! \brief Asks the underlying thread to stop, optionally joining it
    virtual void stop(bool wait = false);

    //! \brief Wakes up the thread if waiting for a kick
    void kick();

    bool is_stopping() const { return state_.load() == State::kStopping; }
    State state() const { return state_.load(); }
    const std::string& name() const { return name_; }

    //! \brief Whether work() terminated by throwing
    bool has_exception() const { return exception_ptr_ != nullptr; }

    //! \brief Returns the message of the captured exception, if any
    std::string what() const;

    //! \brief Rethrows the captured exception, if any
    void rethrow() const;

    boost::signals2::signal<void(Worker* sender)> signal_worker_started;
    boost::signals2::signal<void(Worker* sender)> signal_worker_stopped;

  protected:
    //! \brief Non-busy wait for a kick or the timeout to expire
    //! \return false if the worker has been asked to stop, true otherwise
    bool wait_for_kick(std::chrono::milliseconds timeout = std::chrono::milliseconds{100});

    std::string name_;

  private:
    virtual void work() = 0;

    std::atomic<State> state_{State::kStopped};
    std::atomic_bool kicked_{false};
    std::condition_variable kicked_cv_;
    std::mutex kick_mtx_;
    std::unique_ptr<std::thread> thread_;
    std::exception_ptr exception_ptr_{nullptr};
};

}  // namespace rollup
