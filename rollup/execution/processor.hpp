// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

#include <rollup/core/types/receipt.hpp>
#include <rollup/core/types/transaction.hpp>
#include <rollup/execution/environment.hpp>
#include <rollup/preconf/errors.hpp>

namespace rollup::execution {

//! \brief Executes transactions on top of a build environment
class TransactionProcessor {
  public:
    virtual ~TransactionProcessor() = default;

    //! \brief Executes \p tx against env.state charging env.gas_pool and env.header.gas_used
    //! \details Implementations only touch state, gas pool and header; on error they may leave partial
    //! changes behind, which commit_transaction rolls back
    virtual tl::expected<Receipt, preconf::ExecutionError> apply(BuildEnvironment& env, const Transaction& tx) = 0;
};

//! \brief Applies \p tx to the environment, appending it to the applied transactions on success
//! \details State, gas pool and header gas are restored if execution fails
tl::expected<Receipt, preconf::ExecutionError> commit_transaction(TransactionProcessor& processor,
                                                                  BuildEnvironment& env,
                                                                  const TransactionPtr& tx);

//! \brief Undoes the most recently committed transaction if its hash is \p tx_hash
//! \return false if \p tx_hash is not the last committed transaction since the last environment copy
bool revert_last_transaction(BuildEnvironment& env, const evmc::bytes32& tx_hash);

}  // namespace rollup::execution
