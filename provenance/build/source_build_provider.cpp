// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "source_build_provider.hpp"

#include <provenance/build/build_error.hpp>
#include <provenance/build/dependency_installer.hpp>
#include <provenance/build/project.hpp>
#include <provenance/build/toolchain.hpp>
#include <provenance/infra/common/directories.hpp>
#include <provenance/infra/common/ensure.hpp>
#include <provenance/infra/common/log.hpp>

namespace provenance::build {

RawBytecode SourceBuildProvider::build(const SourceRevision& source, std::string_view contract_name) {
    ensure(!contract_name.empty(), "SourceBuildProvider: contract name must not be empty");
    ensure(!source.repository_url.empty(), "SourceBuildProvider: repository URL must not be empty");

    const auto base_path{settings_.temp_dir.value_or(TemporaryDirectory::get_os_temporary_path())};
    TemporaryDirectory work_dir{base_path, "prov-build-"};
    const auto checkout_path{work_dir.path() / "source"};
    PROV_DEBUG_M("Build directory created", {"path", work_dir.path().string()});

    checkout_source(runner_, source, checkout_path);

    const ProjectLayout layout{detect_project(checkout_path)};
    PROV_DEBUG_M("Project detected",
                 {"package.json", layout.has_package_json ? "yes" : "no",
                  "foundry.toml", layout.has_foundry_config ? "yes" : "no",
                  "hardhat.config", layout.has_hardhat_config ? "yes" : "no"});

    const auto toolchain{select_toolchain(layout)};
    if (!toolchain) {
        throw BuildError{BuildErrorKind::kBuildFailure,
                         "unsupported project layout: neither foundry.toml nor hardhat.config.{js,ts} found"};
    }

    install_dependencies(runner_, layout);

    std::string bytecode;
    switch (*toolchain) {
        case ToolchainKind::kFoundry:
            bytecode = compile_with_foundry(runner_, layout, contract_name);
            break;
        case ToolchainKind::kHardhat:
            bytecode = compile_with_hardhat(runner_, layout, contract_name);
            break;
    }
    PROV_INFO_M("Contract compiled", {"toolchain", to_string(*toolchain), "hex_length",
                                      std::to_string(bytecode.size())});
    return RawBytecode{.hex = std::move(bytecode), .origin = BytecodeOrigin::kBuild};
}

}  // namespace provenance::build
