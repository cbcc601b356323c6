// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "worker.hpp"

#include <rollup/infra/common/log.hpp>

namespace rollup {

Worker::~Worker() {
    // Derived members are gone at this point: the derived destructor must have stopped the thread
    stop(/*wait=*/true);
}

void Worker::start(bool wait) {
    State expected_stopped{State::kStopped};
    if (!state_.compare_exchange_strong(expected_stopped, State::kStarting)) {
        return;
    }

    exception_ptr_ = nullptr;
    kicked_.store(false);

    thread_ = std::make_unique<std::thread>([this]() {
        log::set_thread_name(name_.c_str());
        State expected_starting{State::kStarting};
        if (state_.compare_exchange_strong(expected_starting, State::kStarted)) {
            signal_worker_started(this);
            try {
                work();
            } catch (const std::exception& ex) {
                log::Error(name_, {"exception", std::string{ex.what()}});
                exception_ptr_ = std::current_exception();
            }
        }
        state_.store(State::kStopped);
        signal_worker_stopped(this);
    });

    while (wait) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        const auto current_state{state()};
        if (current_state != State::kStarting) {
            break;
        }
    }
}

void Worker::stop(bool wait) {
    if (!thread_) return;

    if (state_.load() != State::kStopped) {
        state_.store(State::kStopping);
    }
    kick();

    if (wait && thread_->joinable()) {
        thread_->join();
        thread_.reset();
    }
}

void Worker::kick() {
    {
        std::scoped_lock lock{kick_mtx_};
        kicked_.store(true);
    }
    kicked_cv_.notify_all();
}

bool Worker::wait_for_kick(std::chrono::milliseconds timeout) {
    std::unique_lock lock{kick_mtx_};
    if (state_.load() == State::kStarted) {
        State expected_started{State::kStarted};
        state_.compare_exchange_strong(expected_started, State::kKickWaiting);
    }
    kicked_cv_.wait_for(lock, timeout, [this] { return kicked_.load() || is_stopping(); });
    kicked_.store(false);
    if (is_stopping()) {
        return false;
    }
    State expected_waiting{State::kKickWaiting};
    state_.compare_exchange_strong(expected_waiting, State::kStarted);
    return true;
}

std::string Worker::what() const {
    if (!exception_ptr_) return {};
    try {
        std::rethrow_exception(exception_ptr_);
    } catch (const std::exception& ex) {
        return ex.what();
    }
    return "Undefined error";
}

void Worker::rethrow() const {
    if (has_exception()) {
        std::rethrow_exception(exception_ptr_);
    }
}

}  // namespace rollup
