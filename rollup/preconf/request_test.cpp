// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "request.hpp"

#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>

#include <rollup/test_util/sample_data.hpp>

namespace rollup::preconf {

using namespace std::chrono_literals;

TEST_CASE("PreconfCompletion delivers once", "[rollup][preconf][request]") {
    boost::asio::io_context ioc;
    auto [request, channel] = make_preconf_request(test_util::make_transaction(test_util::kSenderA, 0), ioc.get_executor());
    CHECK(request->status->load() == PreconfStatus::kWaiting);
    CHECK_FALSE(request->completion.is_spent());

    SECTION("complete") {
        CHECK(request->completion.complete(PreconfResult{.receipt = Receipt{.success = true}}));
        CHECK(request->completion.is_spent());
        CHECK_FALSE(request->completion.complete(PreconfResult{}));
        CHECK_FALSE(request->completion.abandon());
        CHECK(channel->is_closed());

        const auto result{channel->receive_for(10ms)};
        REQUIRE(result);
        REQUIRE(result->receipt);
        CHECK(result->receipt->success);
    }

    SECTION("abandon") {
        CHECK(request->completion.abandon());
        CHECK_FALSE(request->completion.complete(PreconfResult{}));
        CHECK(channel->is_closed());
        CHECK_FALSE(channel->receive_for(10ms));
    }

    SECTION("abandoned on destruction") {
        request.reset();
        CHECK(channel->is_closed());
        CHECK_FALSE(channel->receive_for(10ms));
    }

    SECTION("moved token carries the channel") {
        PreconfCompletion moved{std::move(request->completion)};
        CHECK(request->completion.is_spent());
        CHECK_FALSE(channel->is_closed());
        CHECK(moved.complete(PreconfResult{.error = PreconfError{GateError::kEnvNil}}));
        const auto result{channel->receive_for(10ms)};
        REQUIRE(result);
        REQUIRE(result->error);
        CHECK(std::get<GateError>(*result->error) == GateError::kEnvNil);
    }
}

}  // namespace rollup::preconf
