// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "journal.hpp"

#include <fstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <rollup/infra/test_util/log.hpp>
#include <rollup/infra/common/directories.hpp>
#include <rollup/test_util/sample_data.hpp>

namespace rollup::txpool {

using namespace evmc::literals;
using test_util::kSenderA;
using test_util::kSenderB;
using test_util::make_deposit;
using test_util::make_transaction;

static Transactions load_all(TxJournal& journal, TxJournal::LoadResult& result) {
    Transactions loaded;
    result = journal.load([&](const Transactions& txs) { loaded.insert(loaded.end(), txs.begin(), txs.end()); });
    return loaded;
}

TEST_CASE("transaction JSON codec", "[rollup][txpool][journal]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    SECTION("ordinary transaction") {
        auto tx{std::make_shared<Transaction>(*make_transaction(kSenderA, 3, test_util::kRecipient, 50'000, Bytes{0x01, 0x02}))};
        tx->value = intx::uint256{1'000'000'000'000'000'000ull};
        const auto json{transaction_to_json(*tx)};
        CHECK(json["nonce"] == 3);
        CHECK(json["gas"] == 50'000);
        CHECK(json["input"] == "0x0102");
        CHECK_FALSE(json.contains("sourceHash"));
        CHECK(*transaction_from_json(json) == *tx);
    }

    SECTION("contract creation") {
        const auto tx{make_transaction(kSenderA, 0, std::nullopt)};
        const auto json{transaction_to_json(*tx)};
        CHECK(json["to"].is_null());
        CHECK_FALSE(transaction_from_json(json)->to);
    }

    SECTION("deposit transaction") {
        const auto tx{make_deposit(0x0000000000000000000000000000000000000000000000000000000000000001_bytes32, 2)};
        const auto json{transaction_to_json(*tx)};
        CHECK(json.contains("sourceHash"));
        CHECK(*transaction_from_json(json) == *tx);
    }

    SECTION("malformed documents") {
        auto json{transaction_to_json(*make_transaction(kSenderA, 0))};
        auto unknown_type = json;
        unknown_type["type"] = 9;
        CHECK_THROWS_AS(transaction_from_json(unknown_type), std::invalid_argument);
        auto bad_input = json;
        bad_input["input"] = "0xzz";
        CHECK_THROWS_AS(transaction_from_json(bad_input), std::invalid_argument);
        auto missing_nonce = json;
        missing_nonce.erase("nonce");
        CHECK_THROWS_AS(transaction_from_json(missing_nonce), nlohmann::json::exception);
    }
}

TEST_CASE("TxJournal", "[rollup][txpool][journal]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    const auto path{tmp_dir.path() / "preconf_transactions.rlp"};
    TxJournal journal{path};
    TxJournal::LoadResult result;

    SECTION("missing journal loads nothing") {
        CHECK(load_all(journal, result).empty());
        CHECK(result.loaded == 0);
        CHECK(result.dropped == 0);
    }

    SECTION("insert requires an open journal") {
        CHECK_THROWS_AS(journal.insert(*make_transaction(kSenderA, 0)), std::runtime_error);
    }

    SECTION("rotate then insert then load") {
        const auto a0{make_transaction(kSenderA, 0)};
        const auto b0{make_transaction(kSenderB, 0)};
        const auto a1{make_transaction(kSenderA, 1)};
        journal.rotate({a0, b0});
        journal.insert(*a1);
        journal.close();

        const auto loaded{load_all(journal, result)};
        REQUIRE(loaded.size() == 3);
        CHECK(*loaded[0] == *a0);
        CHECK(*loaded[1] == *b0);
        CHECK(*loaded[2] == *a1);
        CHECK(result.loaded == 3);

        // Loading closes the journal for writing
        CHECK_THROWS_AS(journal.insert(*a1), std::runtime_error);
    }

    SECTION("rotate replaces the previous content") {
        journal.rotate({make_transaction(kSenderA, 0), make_transaction(kSenderA, 1)});
        const auto b0{make_transaction(kSenderB, 0)};
        journal.rotate({b0});
        journal.close();
        const auto loaded{load_all(journal, result)};
        REQUIRE(loaded.size() == 1);
        CHECK(loaded[0]->hash == b0->hash);
        CHECK_FALSE(std::filesystem::exists(std::filesystem::path{path} += ".new"));
    }

    SECTION("malformed lines are dropped") {
        const auto a0{make_transaction(kSenderA, 0)};
        {
            std::ofstream out{path};
            out << transaction_to_json(*a0).dump() << '\n';
            out << "{not json\n";
            out << '\n';
            out << R"({"type":2})" << '\n';
        }
        const auto loaded{load_all(journal, result)};
        REQUIRE(loaded.size() == 1);
        CHECK(loaded[0]->hash == a0->hash);
        CHECK(result.loaded == 1);
        CHECK(result.dropped == 2);
    }

    SECTION("load hands over batches") {
        Transactions txs;
        for (uint64_t nonce{0}; nonce < TxJournal::kLoadBatchSize + 5; ++nonce) {
            txs.push_back(make_transaction(kSenderA, nonce));
        }
        journal.rotate(txs);
        journal.close();
        std::vector<size_t> batch_sizes;
        result = journal.load([&](const Transactions& batch) { batch_sizes.push_back(batch.size()); });
        CHECK(batch_sizes == std::vector<size_t>{TxJournal::kLoadBatchSize, 5});
        CHECK(result.loaded == txs.size());
    }
}

TEST_CASE("JournalSettings to_string", "[rollup][txpool][journal]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    JournalSettings settings{.path = "journal.rlp", .rotation_interval = std::chrono::minutes{1}};
    CHECK(settings.to_string() == "path: journal.rlp rotation_interval: 60000ms");
}

}  // namespace rollup::txpool
