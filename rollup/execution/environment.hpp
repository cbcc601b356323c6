// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <rollup/core/common/base.hpp>
#include <rollup/core/types/receipt.hpp>
#include <rollup/core/types/transaction.hpp>
#include <rollup/preconf/errors.hpp>

namespace rollup::execution {

struct BlockHeader {
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    evmc::address coinbase;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! \brief Gas still available in the block being built
class GasPool {
  public:
    explicit GasPool(uint64_t gas = 0) : gas_{gas} {}

    uint64_t gas() const { return gas_; }
    void set_gas(uint64_t gas) { gas_ = gas; }
    void add_gas(uint64_t amount) { gas_ += amount; }

    //! \brief Deducts \p amount failing with kGasLimitReached when not enough gas is left
    tl::expected<void, preconf::ExecutionError> sub_gas(uint64_t amount);

  private:
    uint64_t gas_;
};

//! \brief Mutable world state of the block being built, with nested snapshots
class ExecutionState {
  public:
    virtual ~ExecutionState() = default;

    //! \return an identifier to pass to revert_to_snapshot
    virtual int snapshot() = 0;

    //! \brief Undoes every change made after the given snapshot was taken
    virtual void revert_to_snapshot(int snapshot_id) = 0;

    virtual void set_tx_context(const evmc::bytes32& tx_hash, size_t tx_index) = 0;

    //! \brief Deep copy of the current state; snapshots taken on this state are not carried over
    virtual std::unique_ptr<ExecutionState> copy() const = 0;
};

//! \brief What is needed to undo the last applied transaction
struct AppliedTxCheckpoint {
    int snapshot_id{0};
    uint64_t gas_pool{0};
    uint64_t header_gas_used{0};
};

//! \brief In-progress block building context
//! \details Move-only: ownership is handed between the block builder and the speculative executor at every
//! building cycle. copy() is the only way to obtain an independent environment.
struct BuildEnvironment {
    BlockHeader header;
    GasPool gas_pool;
    std::unique_ptr<ExecutionState> state;
    size_t tcount{0};
    Transactions txs;
    std::vector<Receipt> receipts;
    std::vector<AppliedTxCheckpoint> checkpoints;  // one per entry in txs applied since the last copy

    BuildEnvironment(BlockHeader block_header, std::unique_ptr<ExecutionState> execution_state);

    BuildEnvironment(BuildEnvironment&&) noexcept = default;
    BuildEnvironment& operator=(BuildEnvironment&&) noexcept = default;
    BuildEnvironment(const BuildEnvironment&) = delete;
    BuildEnvironment& operator=(const BuildEnvironment&) = delete;

    //! \brief Deep copy of the environment, undo checkpoints excluded
    BuildEnvironment copy() const;

    //! \brief Resets the gas pool to the header gas limit
    void reset_gas_pool() { gas_pool.set_gas(header.gas_limit); }

    //! \return the receipt of an applied transaction or nullptr
    const Receipt* find_receipt(const evmc::bytes32& tx_hash) const;
};

}  // namespace rollup::execution
