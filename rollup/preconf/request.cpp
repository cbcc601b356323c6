// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "request.hpp"

#include <utility>

namespace rollup::preconf {

PreconfCompletion& PreconfCompletion::operator=(PreconfCompletion&& other) noexcept {
    if (this != &other) {
        abandon();
        channel_ = std::move(other.channel_);
    }
    return *this;
}

bool PreconfCompletion::complete(PreconfResult result) {
    const auto channel{std::exchange(channel_, nullptr)};
    if (!channel) return false;
    const bool sent{channel->try_send(std::move(result))};
    channel->close();
    return sent;
}

bool PreconfCompletion::abandon() {
    const auto channel{std::exchange(channel_, nullptr)};
    if (!channel) return false;
    return channel->close();
}

std::pair<PreconfRequestPtr, PreconfResultChannelPtr> make_preconf_request(TransactionPtr tx,
                                                                           const boost::asio::any_io_executor& executor) {
    auto channel{std::make_shared<PreconfResultChannel>(executor)};
    auto request{std::make_shared<PreconfRequest>(PreconfRequest{
        .tx = std::move(tx),
        .status = std::make_shared<PreconfStatusCell>(),
        .completion = PreconfCompletion{channel},
    })};
    return {std::move(request), std::move(channel)};
}

}  // namespace rollup::preconf
