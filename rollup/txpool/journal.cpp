// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "journal.hpp"

#include <stdexcept>
#include <system_error>

#include <intx/intx.hpp>
#include <magic_enum.hpp>

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>
#include <rollup/infra/common/log.hpp>

namespace rollup::txpool {

std::string JournalSettings::to_string() const {
    return "path: " + path.string() + " rotation_interval: " + std::to_string(rotation_interval.count()) + "ms";
}

static std::string to_quantity(const intx::uint256& value) { return "0x" + intx::hex(value); }

static intx::uint256 uint256_from_json(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) return 0;
    return intx::from_string<intx::uint256>(json.at(key).get<std::string>());
}

nlohmann::json transaction_to_json(const Transaction& tx) {
    nlohmann::json json;
    json["type"] = static_cast<uint8_t>(tx.type);
    json["hash"] = to_hex(tx.hash, /*with_prefix=*/true);
    json["from"] = address_to_hex(tx.from);
    json["to"] = tx.to ? nlohmann::json(address_to_hex(*tx.to)) : nlohmann::json(nullptr);
    json["nonce"] = tx.nonce;
    json["gas"] = tx.gas_limit;
    json["value"] = to_quantity(tx.value);
    json["input"] = to_hex(tx.data, /*with_prefix=*/true);
    if (tx.is_deposit()) {
        json["sourceHash"] = to_hex(tx.source_hash, /*with_prefix=*/true);
        json["mint"] = to_quantity(tx.mint);
        json["ethValue"] = to_quantity(tx.eth_value);
        json["ethTxValue"] = to_quantity(tx.eth_tx_value);
        json["isSystemTx"] = tx.is_system_tx;
    }
    return json;
}

TransactionPtr transaction_from_json(const nlohmann::json& json) {
    auto tx{std::make_shared<Transaction>()};
    const auto type{magic_enum::enum_cast<TransactionType>(json.at("type").get<uint8_t>())};
    if (!type) {
        throw std::invalid_argument{"unknown transaction type " + json.at("type").dump()};
    }
    tx->type = *type;
    tx->hash = hex_to_bytes32(json.at("hash").get<std::string>());
    tx->from = hex_to_address(json.at("from").get<std::string>());
    if (json.contains("to") && !json.at("to").is_null()) {
        tx->to = hex_to_address(json.at("to").get<std::string>());
    }
    tx->nonce = json.at("nonce").get<uint64_t>();
    tx->gas_limit = json.at("gas").get<uint64_t>();
    tx->value = uint256_from_json(json, "value");
    const auto input{from_hex(json.at("input").get<std::string>())};
    if (!input) {
        throw std::invalid_argument{"invalid transaction input"};
    }
    tx->data = *input;
    if (tx->is_deposit()) {
        tx->source_hash = hex_to_bytes32(json.at("sourceHash").get<std::string>());
        tx->mint = uint256_from_json(json, "mint");
        tx->eth_value = uint256_from_json(json, "ethValue");
        tx->eth_tx_value = uint256_from_json(json, "ethTxValue");
        tx->is_system_tx = json.value("isSystemTx", false);
    }
    return tx;
}

TxJournal::LoadResult TxJournal::load(const std::function<void(const Transactions&)>& add) {
    LoadResult result;
    if (!std::filesystem::exists(path_)) {
        return result;
    }
    std::ifstream input{path_};
    if (!input.is_open()) {
        throw std::runtime_error{"cannot open journal " + path_.string()};
    }
    // Writing is resumed only by rotate
    close();

    Transactions batch;
    std::string line;
    while (std::getline(input, line)) {
        if (line.empty()) continue;
        try {
            batch.push_back(transaction_from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            ++result.dropped;
            ROLLUP_DEBUG << "TxJournal: dropped malformed line: " << e.what();
            continue;
        } catch (const std::invalid_argument& e) {
            ++result.dropped;
            ROLLUP_DEBUG << "TxJournal: dropped malformed line: " << e.what();
            continue;
        }
        if (batch.size() == kLoadBatchSize) {
            add(batch);
            result.loaded += batch.size();
            batch.clear();
        }
    }
    if (!batch.empty()) {
        add(batch);
        result.loaded += batch.size();
    }
    log::Info("Loaded preconf transaction journal", {"transactions", std::to_string(result.loaded),
                                                     "dropped", std::to_string(result.dropped)});
    return result;
}

void TxJournal::insert(const Transaction& tx) {
    if (!writer_) {
        throw std::runtime_error{"no active journal"};
    }
    *writer_ << transaction_to_json(tx).dump() << '\n';
    writer_->flush();
    if (!*writer_) {
        throw std::runtime_error{"write to journal " + path_.string() + " failed"};
    }
}

void TxJournal::rotate(const Transactions& txs) {
    close();

    std::filesystem::path replacement{path_};
    replacement += ".new";
    {
        std::ofstream output{replacement, std::ios::out | std::ios::trunc};
        if (!output.is_open()) {
            throw std::runtime_error{"cannot create journal " + replacement.string()};
        }
        for (const auto& tx : txs) {
            output << transaction_to_json(*tx).dump() << '\n';
        }
        output.flush();
        if (!output) {
            throw std::runtime_error{"write to journal " + replacement.string() + " failed"};
        }
    }
    std::error_code ec;
    std::filesystem::rename(replacement, path_, ec);
    if (ec) {
        throw std::runtime_error{"cannot replace journal " + path_.string() + ": " + ec.message()};
    }

    writer_ = std::make_unique<std::ofstream>(path_, std::ios::out | std::ios::app);
    if (!writer_->is_open()) {
        writer_.reset();
        throw std::runtime_error{"cannot open journal " + path_.string()};
    }
    ROLLUP_DEBUG << "TxJournal: regenerated journal transactions=" << txs.size();
}

void TxJournal::close() {
    if (writer_) {
        writer_->close();
        writer_.reset();
    }
}

}  // namespace rollup::txpool
