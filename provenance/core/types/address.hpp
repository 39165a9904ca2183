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

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

//! \brief Parses a 0x-prefixed hex string of exactly 20 bytes into an address (hex case is irrelevant)
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

}  // namespace provenance

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
