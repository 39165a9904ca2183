// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <gmock/gmock.h>

#include <provenance/build/build_provider.hpp>

namespace provenance::build::test_util {

class MockBuildProvider : public BuildProvider {  // NOLINT
  public:
    MOCK_METHOD((RawBytecode), build, (const SourceRevision&, std::string_view), (override));
};

}  // namespace provenance::build::test_util
