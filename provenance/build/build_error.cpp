// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "build_error.hpp"

#include <magic_enum.hpp>

namespace provenance::build {

std::ostream& operator<<(std::ostream& out, BuildErrorKind kind) {
    out << magic_enum::enum_name(kind).substr(1);
    return out;
}

}  // namespace provenance::build
