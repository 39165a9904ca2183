// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <provenance/core/common/bytes.hpp>

namespace provenance {

//! Where a bytecode value comes from
enum class BytecodeOrigin {
    kChain,  // Initialization code extracted from the deployment trace
    kBuild,  // Initialization code emitted by the build toolchain
};

//! Error codes for bytecode text decoding
enum class [[nodiscard]] BytecodeError {
    kMissing,       // No payload at all (e.g. creation step without init field)
    kInvalidDigit,  // Non-hex character
    kOddLength,     // Truncated payload, i.e. odd number of hex digits
};

//! Hex-encoded bytecode of unknown validity together with its provenance
struct RawBytecode {
    std::string hex;
    BytecodeOrigin origin{BytecodeOrigin::kChain};
};

//! \brief Decodes bytecode hex text: optional 0x prefix, case-insensitive, even number of digits
tl::expected<Bytes, BytecodeError> parse_bytecode(std::string_view hex);

//! Bytecode payload that cannot be decoded and therefore cannot be normalized nor compared
class MalformedBytecode : public std::runtime_error {
  public:
    MalformedBytecode(BytecodeOrigin origin, BytecodeError error);

    BytecodeOrigin origin() const noexcept { return origin_; }
    BytecodeError error() const noexcept { return error_; }

  private:
    BytecodeOrigin origin_;
    BytecodeError error_;
};

//! \brief Decodes raw bytecode or throws MalformedBytecode naming its origin
Bytes decode_or_throw(const RawBytecode& raw);

std::ostream& operator<<(std::ostream& out, BytecodeOrigin origin);
std::ostream& operator<<(std::ostream& out, BytecodeError error);

}  // namespace provenance
