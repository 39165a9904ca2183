// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "project.hpp"

#include <magic_enum.hpp>

#include <provenance/infra/common/directories.hpp>

namespace provenance::build {

ProjectLayout detect_project(const std::filesystem::path& root) {
    const Directory dir{root};
    return ProjectLayout{
        .root = root,
        .has_package_json = dir.contains_file("package.json"),
        .has_yarn_lock = dir.contains_file("yarn.lock"),
        .has_foundry_config = dir.contains_file("foundry.toml"),
        .has_hardhat_config = dir.contains_file("hardhat.config.js") || dir.contains_file("hardhat.config.ts"),
    };
}

std::optional<ToolchainKind> select_toolchain(const ProjectLayout& layout) {
    if (layout.has_foundry_config) {
        return ToolchainKind::kFoundry;
    }
    if (layout.has_hardhat_config) {
        return ToolchainKind::kHardhat;
    }
    return std::nullopt;
}

std::string to_string(ToolchainKind kind) {
    return std::string{magic_enum::enum_name(kind).substr(1)};
}

std::ostream& operator<<(std::ostream& out, ToolchainKind kind) {
    out << to_string(kind);
    return out;
}

}  // namespace provenance::build
