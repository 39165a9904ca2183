// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <provenance/core/common/bytes.hpp>

namespace provenance {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

//! \brief Parses a 0x-prefixed hex string of exactly 32 bytes (e.g. a transaction hash)
std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace provenance

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value);

}  // namespace evmc
