// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <provenance/build/build_provider.hpp>
#include <provenance/build/process.hpp>
#include <provenance/build/settings.hpp>

namespace provenance::build {

//! BuildProvider cloning the repository into a temporary directory and compiling it with the detected toolchain
class SourceBuildProvider : public BuildProvider {
  public:
    SourceBuildProvider(ProcessRunner& runner, BuildSettings settings) : runner_{runner}, settings_{std::move(settings)} {}

    RawBytecode build(const SourceRevision& source, std::string_view contract_name) override;

  private:
    ProcessRunner& runner_;
    BuildSettings settings_;
};

}  // namespace provenance::build
