// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <provenance/core/verify/bytecode.hpp>
#include <provenance/core/verify/normalizer.hpp>
#include <provenance/core/verify/verification_result.hpp>

namespace provenance {

//! Outcome of comparing on-chain and built initialization code
struct Comparison {
    VerificationResult result{VerificationResult::kMismatch};  // Either kMatch or kMismatch
    NormalizedBytecode on_chain;
    NormalizedBytecode built;
    size_t common_prefix{0};  // Offset of the first differing byte on mismatch
};

//! \brief Normalizes both bytecode values and checks them for exact equality
//! \throws MalformedBytecode if either value is not valid even-length hex
Comparison compare(const RawBytecode& on_chain, const RawBytecode& built, const NormalizerSettings& settings = {});

}  // namespace provenance
