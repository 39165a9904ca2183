// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <provenance/rpc/trace_source.hpp>

namespace provenance::rpc::test_util {

class MockTraceSource : public TraceSource {  // NOLINT
  public:
    MOCK_METHOD((TraceEntries), fetch_trace, (const evmc::bytes32&), (override));
};

}  // namespace provenance::rpc::test_util
