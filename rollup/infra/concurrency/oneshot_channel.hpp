// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace rollup::concurrency {

//! \brief Channel carrying at most one value from one producer to one consumer
//! \details Once a value has been sent or the channel has been closed every further send is rejected,
//! so a late producer can never write into a channel its consumer has already given up on.
//! Closing after a successful send is allowed and keeps the value available to the consumer.
//! See also: https://docs.rs/tokio/1.25.0/tokio/sync/oneshot/index.html
template <typename T>
class OneshotChannel {
  public:
    //! Invoked with the value, or std::nullopt if the channel is closed empty
    using Callback = std::function<void(std::optional<T>)>;

    explicit OneshotChannel(const boost::asio::any_io_executor& executor) : channel_{executor, 1} {}

    OneshotChannel(const OneshotChannel&) = delete;
    OneshotChannel& operator=(const OneshotChannel&) = delete;

    //! \brief Delivers the value unless something was already sent or the channel is closed
    //! \return true if the value has been accepted
    bool try_send(T value) {
        if (sent_.exchange(true)) return false;
        return channel_.try_send(boost::system::error_code{}, std::move(value));
    }

    //! \brief Closes the channel, a pending receive completes empty
    //! \return true only for the call which actually closed it
    bool close() {
        if (closed_.exchange(true)) return false;
        channel_.close();
        return true;
    }

    bool is_closed() const { return closed_.load(); }

    //! \return the value if it has already been sent and not received yet
    std::optional<T> try_receive() {
        std::optional<T> result;
        channel_.try_receive([&](const boost::system::error_code& error, T value) {
            if (!error) {
                result = std::move(value);
            }
        });
        return result;
    }

    //! \brief Waits up to timeout for the value, the channel is closed if the wait expires
    //! \return the value or std::nullopt if the channel was closed empty or the wait expired
    template <class Rep, class Period>
    std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        if (auto value{try_receive()}) {
            return value;
        }
        if (is_closed()) {
            return std::nullopt;
        }
        auto future{channel_.async_receive(boost::asio::use_future)};
        if (future.wait_for(timeout) != std::future_status::ready) {
            close();
            return std::nullopt;
        }
        try {
            return future.get();
        } catch (const boost::system::system_error& ex) {
            if (ex.code() == boost::asio::experimental::error::channel_closed ||
                ex.code() == boost::asio::experimental::error::channel_cancelled) {
                return std::nullopt;
            }
            throw;
        }
    }

    //! \brief Registers the consumer callback, invoked exactly once on the channel executor
    void on_ready(Callback callback) {
        channel_.async_receive([callback = std::move(callback)](const boost::system::error_code& error, T value) {
            if (error) {
                callback(std::nullopt);
            } else {
                callback(std::move(value));
            }
        });
    }

  private:
    using AsyncChannel = boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)>;

    AsyncChannel channel_;
    std::atomic_bool sent_{false};
    std::atomic_bool closed_{false};
};

template <typename T>
using OneshotChannelPtr = std::shared_ptr<OneshotChannel<T>>;

}  // namespace rollup::concurrency
