// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <rollup/core/types/transaction.hpp>

namespace rollup::txpool {

struct JournalSettings {
    //! File the preconfirmed transactions are journaled into, journaling is disabled if empty
    std::filesystem::path path;
    //! Interval between two journal rotations
    std::chrono::milliseconds rotation_interval{std::chrono::hours{1}};

    std::string to_string() const;
};

//! JSON representation of a transaction inside the journal
nlohmann::json transaction_to_json(const Transaction& tx);

//! \throws std::invalid_argument or nlohmann::json::exception on malformed input
TransactionPtr transaction_from_json(const nlohmann::json& json);

//! \brief Append-only file of transactions, one JSON document per line
class TxJournal {
  public:
    //! Maximum number of transactions handed over at once while loading
    static constexpr size_t kLoadBatchSize{1024};

    struct LoadResult {
        size_t loaded{0};
        size_t dropped{0};  // unparseable lines
    };

    explicit TxJournal(std::filesystem::path path) : path_{std::move(path)} {}

    //! \brief Reads the journal handing the transactions over in batches to \p add
    //! \details A missing journal is not an error. The journal is not open for writing afterwards.
    LoadResult load(const std::function<void(const Transactions&)>& add);

    //! \brief Appends a transaction to the journal
    //! \throws std::runtime_error if the journal is not open for writing or the write fails
    void insert(const Transaction& tx);

    //! \brief Rewrites the journal with \p txs only and reopens it for appending
    //! \throws std::runtime_error on I/O failure
    void rotate(const Transactions& txs);

    void close();

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
    std::unique_ptr<std::ofstream> writer_;
};

}  // namespace rollup::txpool
