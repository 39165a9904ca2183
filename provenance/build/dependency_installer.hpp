// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <provenance/build/process.hpp>
#include <provenance/build/project.hpp>

namespace provenance::build {

//! \brief Installs package and library dependencies of the project, completing before any compilation
//! Node packages go through yarn when available and npm otherwise, Foundry libraries through forge install
//! \throws BuildError kDependencyMissing if no suitable tool is installed, kBuildFailure if installation fails
void install_dependencies(ProcessRunner& runner, const ProjectLayout& layout);

}  // namespace provenance::build
