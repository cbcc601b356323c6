// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>

namespace rollup {

using Catch::Matchers::Message;

TEST_CASE("ensure", "[rollup][infra][ensure]") {
    CHECK_NOTHROW(ensure(true, "ignored"));
    CHECK_THROWS_MATCHES(ensure(false, "FifoTxSet::add: null transaction"), std::logic_error,
                         Message("FifoTxSet::add: null transaction"));
}

}  // namespace rollup
