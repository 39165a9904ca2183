// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <provenance/verifier/settings.hpp>

namespace provenance::cmd::common {

//! CLI11 validator for 0x-prefixed hex strings of a fixed byte length
struct FixedHexValidator : public CLI::Validator {
    FixedHexValidator(size_t num_bytes, std::string_view what);
};

//! CLI11 validator for http:// and https:// endpoint URLs
struct EndpointValidator : public CLI::Validator {
    EndpointValidator();
};

//! CLI11 validator for metadata markers, i.e. non-empty hex byte sequences
struct MetadataMarkerValidator : public CLI::Validator {
    MetadataMarkerValidator();
};

void add_verifier_options(CLI::App& cli, verifier::VerifierOptions& options);

}  // namespace provenance::cmd::common
