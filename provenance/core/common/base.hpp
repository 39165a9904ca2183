// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace provenance {

using namespace std::string_view_literals;

using BlockNum = uint64_t;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

}  // namespace provenance
