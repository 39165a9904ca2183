// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace provenance::build {

enum class ToolchainKind {
    kFoundry,
    kHardhat,
};

//! Build-relevant files found at the root of a checkout
struct ProjectLayout {
    std::filesystem::path root;
    bool has_package_json{false};
    bool has_yarn_lock{false};
    bool has_foundry_config{false};
    bool has_hardhat_config{false};
};

ProjectLayout detect_project(const std::filesystem::path& root);

//! \brief Foundry wins over Hardhat when both are configured
std::optional<ToolchainKind> select_toolchain(const ProjectLayout& layout);

std::string to_string(ToolchainKind kind);

std::ostream& operator<<(std::ostream& out, ToolchainKind kind);

}  // namespace provenance::build
