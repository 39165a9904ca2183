// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

namespace provenance {

//! Terminal classification of a verification run
enum class VerificationResult {
    kMatch,
    kMismatch,
    kNotFound,
    kAmbiguous,
};

std::ostream& operator<<(std::ostream& out, VerificationResult result);

}  // namespace provenance
