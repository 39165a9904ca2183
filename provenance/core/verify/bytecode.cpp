// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bytecode.hpp"

#include <magic_enum.hpp>

#include <provenance/core/common/util.hpp>

namespace provenance {

tl::expected<Bytes, BytecodeError> parse_bytecode(std::string_view hex) {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.length() % 2 != 0) {
        return tl::make_unexpected(BytecodeError::kOddLength);
    }
    auto bytes{from_hex(hex)};
    if (!bytes) {
        return tl::make_unexpected(BytecodeError::kInvalidDigit);
    }
    return std::move(*bytes);
}

static std::string make_message(BytecodeOrigin origin, BytecodeError error) {
    std::string message{origin == BytecodeOrigin::kChain ? "malformed on-chain bytecode: " : "malformed build bytecode: "};
    switch (error) {
        case BytecodeError::kMissing:
            message += "no payload";
            break;
        case BytecodeError::kInvalidDigit:
            message += "invalid hex digit";
            break;
        case BytecodeError::kOddLength:
            message += "odd number of hex digits (truncated payload)";
            break;
    }
    return message;
}

MalformedBytecode::MalformedBytecode(BytecodeOrigin origin, BytecodeError error)
    : std::runtime_error{make_message(origin, error)}, origin_{origin}, error_{error} {}

Bytes decode_or_throw(const RawBytecode& raw) {
    auto bytes{parse_bytecode(raw.hex)};
    if (!bytes) {
        throw MalformedBytecode{raw.origin, bytes.error()};
    }
    return std::move(*bytes);
}

std::ostream& operator<<(std::ostream& out, BytecodeOrigin origin) {
    out << magic_enum::enum_name(origin);
    return out;
}

std::ostream& operator<<(std::ostream& out, BytecodeError error) {
    out << magic_enum::enum_name(error);
    return out;
}

}  // namespace provenance
