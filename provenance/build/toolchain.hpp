// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <provenance/build/process.hpp>
#include <provenance/build/project.hpp>

namespace provenance::build {

//! \brief Compiles with `forge inspect --force <contract> bytecode` and returns the initialization bytecode hex text
std::string compile_with_foundry(ProcessRunner& runner, const ProjectLayout& layout, std::string_view contract_name);

//! \brief Compiles with `npx hardhat compile --force` and returns the "bytecode" field of the contract artifact
//! \details The contract can be given by name (e.g. "Token") or fully qualified (e.g. "contracts/Token.sol:Token")
std::string compile_with_hardhat(ProcessRunner& runner, const ProjectLayout& layout, std::string_view contract_name);

//! \brief Checks that toolchain output is a single printable token and returns it without surrounding whitespace
//! \throws BuildError kToolchainError otherwise
std::string validate_bytecode_output(std::string_view output, std::string_view toolchain);

}  // namespace provenance::build
