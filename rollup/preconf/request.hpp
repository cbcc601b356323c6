// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/any_io_executor.hpp>

#include <rollup/core/types/receipt.hpp>
#include <rollup/core/types/transaction.hpp>
#include <rollup/infra/concurrency/oneshot_channel.hpp>
#include <rollup/preconf/errors.hpp>
#include <rollup/preconf/status.hpp>

namespace rollup::preconf {

//! \brief Outcome of the speculative execution of one transaction
struct PreconfResult {
    std::optional<Receipt> receipt;
    std::optional<PreconfError> error;
};

using PreconfResultChannel = concurrency::OneshotChannel<PreconfResult>;
using PreconfResultChannelPtr = std::shared_ptr<PreconfResultChannel>;

//! \brief Sending side of a request result channel, owned by whoever processes the request
//! \details Completing delivers the result and closes the channel, abandoning just closes it.
//! Either can happen once: afterwards the token is spent and every further call is a no-op.
//! A token destroyed while unspent abandons the channel.
class PreconfCompletion {
  public:
    explicit PreconfCompletion(PreconfResultChannelPtr channel) : channel_{std::move(channel)} {}
    ~PreconfCompletion() { abandon(); }

    PreconfCompletion(const PreconfCompletion&) = delete;
    PreconfCompletion& operator=(const PreconfCompletion&) = delete;
    PreconfCompletion(PreconfCompletion&& other) noexcept : channel_{std::move(other.channel_)} {}
    PreconfCompletion& operator=(PreconfCompletion&& other) noexcept;

    //! \return true if the result has been accepted by the channel
    bool complete(PreconfResult result);

    //! \return true if this call closed the channel
    bool abandon();

    bool is_spent() const { return channel_ == nullptr; }

  private:
    PreconfResultChannelPtr channel_;
};

//! \brief Cross-subsystem preconfirmation request published by the intake to the processing loop
struct PreconfRequest {
    TransactionPtr tx;
    PreconfStatusCellPtr status;
    PreconfCompletion completion;
};

using PreconfRequestPtr = std::shared_ptr<PreconfRequest>;

//! \brief Creates a request for \p tx in kWaiting status along with the receiving side of its result channel
//! \details Result callbacks registered on the channel run on \p executor
std::pair<PreconfRequestPtr, PreconfResultChannelPtr> make_preconf_request(TransactionPtr tx,
                                                                           const boost::asio::any_io_executor& executor);

}  // namespace rollup::preconf
