// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>

namespace provenance::build {

struct BuildSettings {
    //! Base path for checkout directories (OS temporary path if not set)
    std::optional<std::filesystem::path> temp_dir;
    //! Deadline for each external command (none if not set)
    std::optional<std::chrono::seconds> command_timeout;
};

}  // namespace provenance::build
