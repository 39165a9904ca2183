// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>

#include <provenance/build/process.hpp>

namespace provenance::build::test_util {

class MockProcessRunner : public ProcessRunner {  // NOLINT
  public:
    MOCK_METHOD((std::optional<std::filesystem::path>), find_program, (std::string_view), (override));
    MOCK_METHOD((ProcessResult), run, (const Command&), (override));

    //! Makes every program in the list resolvable under /usr/bin
    void install(std::initializer_list<std::string_view> programs) {
        for (const auto program : programs) {
            ON_CALL(*this, find_program(testing::Eq(program)))
                .WillByDefault(testing::Return(std::filesystem::path{"/usr/bin"} / program));
        }
    }
};

//! Matches a Command by program and arguments
MATCHER_P2(IsCommand, program, args, "") {
    return arg.program == program && arg.args == std::vector<std::string>(args);
}

}  // namespace provenance::build::test_util
