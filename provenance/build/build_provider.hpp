// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <provenance/build/source_checkout.hpp>
#include <provenance/core/verify/bytecode.hpp>

namespace provenance::build {

//! Produces the initialization bytecode of a contract from its claimed source
class BuildProvider {
  public:
    virtual ~BuildProvider() = default;

    //! \return the raw bytecode with origin kBuild
    //! \throws BuildError on any failure
    virtual RawBytecode build(const SourceRevision& source, std::string_view contract_name) = 0;
};

}  // namespace provenance::build
