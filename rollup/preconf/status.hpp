// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace rollup::preconf {

//! \brief Verdict of a preconfirmation request
enum class PreconfStatus : uint8_t {
    kWaiting,
    kSuccess,
    kFailed,
    kTimeout,
};

//! \return the lowercase status name used in events, e.g. "timeout"
std::string to_string(PreconfStatus status);

std::ostream& operator<<(std::ostream& out, PreconfStatus status);

inline bool is_terminal(PreconfStatus status) { return status != PreconfStatus::kWaiting; }

//! \brief Status shared by the processing loop and the timeout path of one request
//! \details The first actor moving the status away from kWaiting wins, every later attempt is rejected
class PreconfStatusCell {
  public:
    PreconfStatusCell() = default;
    PreconfStatusCell(const PreconfStatusCell&) = delete;
    PreconfStatusCell& operator=(const PreconfStatusCell&) = delete;

    PreconfStatus load() const { return status_.load(std::memory_order_acquire); }

    //! \brief Atomically moves the status from \p from to \p to
    //! \return true if the transition happened, false if the current status was not \p from
    bool transition(PreconfStatus from, PreconfStatus to) {
        return status_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
    }

  private:
    std::atomic<PreconfStatus> status_{PreconfStatus::kWaiting};
};

using PreconfStatusCellPtr = std::shared_ptr<PreconfStatusCell>;

}  // namespace rollup::preconf
