// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace provenance::build {

enum class BuildErrorKind {
    kDependencyMissing,  // a required external tool is not installed
    kBuildFailure,       // checkout, installation or compilation failed
    kToolchainError,     // the toolchain ran but its output is unusable (or it timed out)
};

//! Failure while turning a source revision into initialization bytecode
class BuildError : public std::runtime_error {
  public:
    BuildError(BuildErrorKind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

    BuildErrorKind kind() const noexcept { return kind_; }

  private:
    BuildErrorKind kind_;
};

std::ostream& operator<<(std::ostream& out, BuildErrorKind kind);

}  // namespace provenance::build
