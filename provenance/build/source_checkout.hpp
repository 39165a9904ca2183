// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <provenance/build/process.hpp>

namespace provenance::build {

//! Claimed source: a git repository and an optional revision pin (commit, tag or branch)
struct SourceRevision {
    std::string repository_url;
    std::optional<std::string> revision;
};

//! \brief Clones the repository into an empty directory and checks out the pinned revision, if any
//! \throws BuildError kDependencyMissing without git, kBuildFailure if clone or checkout fail
void checkout_source(ProcessRunner& runner, const SourceRevision& source, const std::filesystem::path& dir);

}  // namespace provenance::build
