// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <rollup/l1/sources.hpp>

namespace rollup::test_util {

//! \brief gMock mock class for l1::SyncStatusSource
class MockSyncStatusSource : public l1::SyncStatusSource {
  public:
    MOCK_METHOD((preconf::SyncStatus), sync_status, (), (override));
};

//! \brief gMock mock class for l1::L1LogSource
class MockL1LogSource : public l1::L1LogSource {
  public:
    MOCK_METHOD((Logs), filter_logs, (const l1::LogFilter&), (override));
};

}  // namespace rollup::test_util
