// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <gmock/gmock.h>

#include <provenance/rpc/http/transport.hpp>

namespace provenance::rpc::test_util {

class MockTransport : public http::Transport {  // NOLINT
  public:
    MOCK_METHOD((http::Response), post, (const Endpoint&, const std::string&), (override));
};

}  // namespace provenance::rpc::test_util
