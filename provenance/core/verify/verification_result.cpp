// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "verification_result.hpp"

#include <magic_enum.hpp>

namespace provenance {

std::ostream& operator<<(std::ostream& out, VerificationResult result) {
    out << magic_enum::enum_name(result).substr(1);
    return out;
}

}  // namespace provenance
