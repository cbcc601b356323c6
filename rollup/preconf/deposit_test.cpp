// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "deposit.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>
#include <rollup/test_util/sample_data.hpp>

namespace rollup::preconf {

using namespace evmc::literals;

// TransactionDeposited log carrying a version 1 deposit as emitted by the L1 portal
static Log sample_version1_log() {
    Log log{
        .address = 0xa513e6e4b8f2a923d98304ec87f64353c4d5c853_address,
        .topics = {
            0xb3813568d9991fc951961fcb4c784893574240a28925604d09fc577c55bb7c32_bytes32,
            0x0000000000000000000000001276878a594ca255338adfa4d48449f69242fca0_bytes32,
            0x0000000000000000000000004200000000000000000000000000000000000007_bytes32,
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32,
        },
        .block_num = 10,
        .block_hash = 0x0000000000000000000000000000000000000000000000000000000000000123_bytes32,
        .tx_hash = 0x0000000000000000000000000000000000000000000000000000000000000123_bytes32,
    };
    log.data = *from_hex(
        "0000000000000000000000000000000000000000000000000000000000000020"
        "000000000000000000000000000000000000000000000000000000000000024d"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000000"
        "000000000024ef1200ff8daf1500010000000000000000000000000000000000"
        "00000000000000000000000000000000000000000000000000dc64a140aa3e98"
        "1100a9beca4e685f962f0cf6c900000000000000000000000042000000000000"
        "0000000000000000000000001000000000000000000000000000000000000000"
        "0000000000000000000000000100000000000000000000000000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000000"
        "000000000000000000001e848000000000000000000000000000000000000000"
        "000000000000000000000000e000000000000000000000000000000000000000"
        "000000000000000000000000a4f407a99e000000000000000000000000f39fd6"
        "e51aad88f6f4ce6ab8827279cfffb92266000000000000000000000000f39fd6"
        "e51aad88f6f4ce6ab8827279cfffb92266000000000000000000000000000000"
        "0000000000000000000000000000000001000000000000000000000000000000"
        "0000000000000000000000000000000080000000000000000000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000000");
    return log;
}

TEST_CASE("decode version 1 deposit", "[rollup][preconf][deposit]") {
    const auto log{sample_version1_log()};
    REQUIRE(log.data.size() == 672);

    const auto tx{decode_deposit_log(log)};
    REQUIRE(tx);
    CHECK(tx->is_deposit());
    CHECK(tx->from == 0x1276878a594ca255338adfa4d48449f69242fca0_address);
    CHECK(tx->to == 0x4200000000000000000000000000000000000007_address);
    CHECK(tx->mint == 1);
    CHECK(tx->value == 1);
    CHECK(tx->eth_value == 0);
    CHECK(tx->eth_tx_value == 0);
    CHECK(tx->gas_limit == 2'420'498);
    CHECK(tx->data.size() == 452);
    CHECK(tx->data[0] == 0xff);
    CHECK(tx->source_hash == user_deposit_source_hash(log.block_hash, log.index));
    CHECK(tx->hash == tx->source_hash);
}

TEST_CASE("decode version 0 deposit", "[rollup][preconf][deposit]") {
    const auto block_hash{0x00000000000000000000000000000000000000000000000000000000000000aa_bytes32};
    const auto log{test_util::make_deposit_log(block_hash, 3, test_util::kDepositor, test_util::kRecipient, 50'000)};

    const auto tx{decode_deposit_log(log)};
    CHECK(tx->from == test_util::kDepositor);
    CHECK(tx->to == test_util::kRecipient);
    CHECK(tx->mint == 1);
    CHECK(tx->value == 0);
    CHECK(tx->gas_limit == 50'000);
    CHECK(tx->data.empty());
    CHECK(tx->hash == test_util::make_deposit(block_hash, 3)->hash);
}

TEST_CASE("source hash identifies the L1 log", "[rollup][preconf][deposit]") {
    const auto block_hash{0x00000000000000000000000000000000000000000000000000000000000000aa_bytes32};
    CHECK(user_deposit_source_hash(block_hash, 0) == user_deposit_source_hash(block_hash, 0));
    CHECK(user_deposit_source_hash(block_hash, 0) != user_deposit_source_hash(block_hash, 1));
    CHECK(user_deposit_source_hash(block_hash, 0) != user_deposit_source_hash(evmc::bytes32{}, 0));
}

TEST_CASE("malformed deposit logs", "[rollup][preconf][deposit]") {
    auto log{sample_version1_log()};

    SECTION("wrong topic count") {
        log.topics.pop_back();
        CHECK_THROWS_AS(decode_deposit_log(log), DepositDecodingError);
    }

    SECTION("wrong event") {
        log.topics[0] = evmc::bytes32{};
        CHECK_THROWS_AS(decode_deposit_log(log), DepositDecodingError);
    }

    SECTION("unsupported version") {
        log.topics[3] = 0x0000000000000000000000000000000000000000000000000000000000000002_bytes32;
        CHECK_THROWS_AS(decode_deposit_log(log), DepositDecodingError);
    }

    SECTION("truncated data") {
        log.data.resize(100);
        CHECK_THROWS_AS(decode_deposit_log(log), DepositDecodingError);
    }

    SECTION("bad offset") {
        log.data[31] = 0x40;
        CHECK_THROWS_AS(decode_deposit_log(log), DepositDecodingError);
    }

    SECTION("opaque payload too short for its version") {
        log.data[62] = 0x00;
        log.data[63] = 0x40;
        CHECK_THROWS_AS(decode_deposit_log(log), DepositDecodingError);
    }
}

}  // namespace rollup::preconf
