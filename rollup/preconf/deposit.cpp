// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "deposit.hpp"

#include <memory>

#include <intx/intx.hpp>

#include <rollup/core/common/util.hpp>
#include <rollup/core/types/address.hpp>

namespace rollup::preconf {

static constexpr size_t kWordSize{32};
static constexpr size_t kGasSize{8};

evmc::bytes32 user_deposit_source_hash(const evmc::bytes32& l1_block_hash, uint64_t log_index) {
    Bytes deposit_id(2 * kWordSize, '\0');
    std::copy_n(l1_block_hash.bytes, kWordSize, deposit_id.data());
    intx::be::unsafe::store(deposit_id.data() + 2 * kWordSize - sizeof(uint64_t), log_index);
    const evmc::bytes32 deposit_id_hash{keccak256_hash(deposit_id)};

    // The first word is the user deposit domain, i.e. zero
    Bytes domain_input(2 * kWordSize, '\0');
    std::copy_n(deposit_id_hash.bytes, kWordSize, domain_input.data() + kWordSize);
    return keccak256_hash(domain_input);
}

namespace {

    //! Sequential reader over the opaque payload
    class OpaqueReader {
      public:
        explicit OpaqueReader(ByteView data) : data_{data} {}

        intx::uint256 read_uint256() {
            const auto word{take(kWordSize)};
            return intx::be::unsafe::load<intx::uint256>(word.data());
        }

        uint64_t read_uint64() {
            const auto word{take(kGasSize)};
            return intx::be::unsafe::load<uint64_t>(word.data());
        }

        bool read_bool() { return take(1)[0] != 0; }

        ByteView rest() const { return data_; }

      private:
        ByteView take(size_t size) {
            if (data_.size() < size) {
                throw DepositDecodingError{"opaque data too short"};
            }
            const ByteView chunk{data_.substr(0, size)};
            data_ = data_.substr(size);
            return chunk;
        }

        ByteView data_;
    };

}  // namespace

TransactionPtr decode_deposit_log(const Log& log) {
    if (log.topics.size() != 4) {
        throw DepositDecodingError{"expected 4 topics, got " + std::to_string(log.topics.size())};
    }
    if (log.topics[0] != kDepositEventTopic) {
        throw DepositDecodingError{"invalid event topic " + to_hex(log.topics[0], /*with_prefix=*/true)};
    }

    // ABI encoding of a single dynamic bytes argument: offset, length, padded payload
    const ByteView data{log.data};
    if (data.size() < 2 * kWordSize) {
        throw DepositDecodingError{"data too short"};
    }
    const auto offset{intx::be::unsafe::load<intx::uint256>(data.data())};
    if (offset != kWordSize) {
        throw DepositDecodingError{"invalid opaque data offset " + intx::to_string(offset)};
    }
    const auto length{intx::be::unsafe::load<intx::uint256>(data.data() + kWordSize)};
    if (length > data.size() - 2 * kWordSize) {
        throw DepositDecodingError{"opaque data length " + intx::to_string(length) + " exceeds payload"};
    }
    const ByteView opaque{data.substr(2 * kWordSize, static_cast<size_t>(length))};

    auto tx{std::make_shared<Transaction>()};
    tx->type = TransactionType::kDeposit;
    tx->from = bytes_to_address(byte_view(log.topics[1].bytes));
    const evmc::address to{bytes_to_address(byte_view(log.topics[2].bytes))};
    tx->source_hash = user_deposit_source_hash(log.block_hash, log.index);
    tx->hash = tx->source_hash;

    const auto version{intx::be::load<intx::uint256>(log.topics[3])};
    OpaqueReader reader{opaque};
    if (version == kDepositVersion0) {
        tx->mint = reader.read_uint256();
        tx->value = reader.read_uint256();
    } else if (version == kDepositVersion1) {
        tx->mint = reader.read_uint256();
        tx->value = reader.read_uint256();
        tx->eth_value = reader.read_uint256();
        tx->eth_tx_value = reader.read_uint256();
    } else {
        throw DepositDecodingError{"unsupported version " + intx::to_string(version)};
    }
    tx->gas_limit = reader.read_uint64();
    const bool is_creation{reader.read_bool()};
    if (!is_creation) {
        tx->to = to;
    }
    tx->data = Bytes{reader.rest()};
    return tx;
}

}  // namespace rollup::preconf
