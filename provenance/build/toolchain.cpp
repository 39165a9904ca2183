// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "toolchain.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include <absl/strings/ascii.h>
#include <nlohmann/json.hpp>

#include <provenance/build/build_error.hpp>
#include <provenance/core/common/util.hpp>
#include <provenance/infra/common/log.hpp>

namespace provenance::build {

namespace fs = std::filesystem;

std::string validate_bytecode_output(std::string_view output, std::string_view toolchain) {
    const auto is_printable = [](char c) { return c >= 0x20 && c <= 0x7e; };
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    for (const char c : output) {
        if (!is_printable(c) && !is_space(c)) {
            throw BuildError{BuildErrorKind::kToolchainError,
                             std::string{toolchain} + " output is not printable ASCII text"};
        }
    }

    const absl::string_view stripped{absl::StripAsciiWhitespace(absl::string_view{output.data(), output.size()})};
    const std::string_view token{stripped.data(), stripped.size()};
    if (token.empty()) {
        throw BuildError{BuildErrorKind::kToolchainError, std::string{toolchain} + " produced no bytecode"};
    }
    if (std::any_of(token.begin(), token.end(), is_space)) {
        throw BuildError{BuildErrorKind::kToolchainError,
                         std::string{toolchain} + " output is not a single bytecode token: " + abridge(token, 80)};
    }
    return std::string{token};
}

std::string compile_with_foundry(ProcessRunner& runner, const ProjectLayout& layout, std::string_view contract_name) {
    require_program(runner, "forge");
    PROV_INFO_M("Compiling with Foundry", {"contract", std::string{contract_name}});
    const auto result{run_checked(runner, Command{
                                              .program = "forge",
                                              .args = {"inspect", "--force", std::string{contract_name}, "bytecode"},
                                              .working_dir = layout.root,
                                          })};
    return validate_bytecode_output(result.out, "forge");
}

//! Artifacts named <contract>.json under the Hardhat artifacts directory (debug files excluded)
static std::vector<fs::path> find_artifacts(const fs::path& artifacts_dir, std::string_view contract_name) {
    std::string source_path;
    std::string name{contract_name};
    if (const auto colon{contract_name.rfind(':')}; colon != std::string_view::npos) {
        source_path = std::string{contract_name.substr(0, colon)};
        name = std::string{contract_name.substr(colon + 1)};
    }

    std::vector<fs::path> artifacts;
    if (!source_path.empty()) {
        const auto artifact{artifacts_dir / source_path / (name + ".json")};
        if (fs::is_regular_file(artifact)) {
            artifacts.push_back(artifact);
        }
        return artifacts;
    }

    std::error_code ec;
    for (fs::recursive_directory_iterator it{artifacts_dir, ec}, end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().filename() == name + ".json" &&
            it->path().parent_path().filename() != "build-info") {
            artifacts.push_back(it->path());
        }
    }
    if (ec) {
        throw BuildError{BuildErrorKind::kBuildFailure, "cannot scan " + artifacts_dir.string() + ": " + ec.message()};
    }
    return artifacts;
}

std::string compile_with_hardhat(ProcessRunner& runner, const ProjectLayout& layout, std::string_view contract_name) {
    require_program(runner, "npx");
    PROV_INFO_M("Compiling with Hardhat", {"contract", std::string{contract_name}});
    run_checked(runner, Command{
                            .program = "npx",
                            .args = {"hardhat", "compile", "--force"},
                            .working_dir = layout.root,
                        });

    const auto artifacts{find_artifacts(layout.root / "artifacts", contract_name)};
    if (artifacts.empty()) {
        throw BuildError{BuildErrorKind::kBuildFailure, "no Hardhat artifact found for " + std::string{contract_name}};
    }
    if (artifacts.size() > 1) {
        throw BuildError{BuildErrorKind::kBuildFailure, std::to_string(artifacts.size()) +
                                                            " Hardhat artifacts match " + std::string{contract_name} +
                                                            ", use a fully qualified name (e.g. contracts/A.sol:A)"};
    }
    PROV_DEBUG_M("Reading artifact", {"path", artifacts.front().string()});

    std::ifstream artifact_stream{artifacts.front()};
    const auto artifact = nlohmann::json::parse(artifact_stream, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (artifact.is_discarded() || !artifact.is_object()) {
        throw BuildError{BuildErrorKind::kToolchainError, "invalid Hardhat artifact " + artifacts.front().string()};
    }
    const auto bytecode{artifact.find("bytecode")};
    if (bytecode == artifact.end() || !bytecode->is_string()) {
        throw BuildError{BuildErrorKind::kToolchainError, "Hardhat artifact has no bytecode field"};
    }
    return validate_bytecode_output(bytecode->get<std::string>(), "hardhat");
}

}  // namespace provenance::build
