// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <iostream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include <intx/intx.hpp>

#include <provenance/core/common/base.hpp>
#include <provenance/core/common/bytes.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << "0x" << intx::hex(value);
    return out;
}

}  // namespace intx

namespace provenance {

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

inline bool is_valid_hex(std::string_view s) {
    static const std::regex kHexRegex("^0x[0-9a-fA-F]+$");
    return std::regex_match(s.begin(), s.end(), kHexRegex);
}

inline bool is_valid_hash(std::string_view s) {
    if (s.length() != 2 + kHashLength * 2) {
        return false;
    }
    return is_valid_hex(s);
}

inline bool is_valid_address(std::string_view s) {
    if (s.length() != 2 + kAddressLength * 2) {
        return false;
    }
    return is_valid_hex(s);
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string (optional 0x prefix) into bytes
//! \remarks An odd number of digits is accepted and treated as left-padded with one zero
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// The length of the longest common prefix of a and b.
size_t prefix_length(ByteView a, ByteView b);

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const Bytes& bytes) {
    out << to_hex(bytes);
    return out;
}

}  // namespace provenance
