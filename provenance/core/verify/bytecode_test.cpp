// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bytecode.hpp"

#include <catch2/catch.hpp>

namespace provenance {

TEST_CASE("parse_bytecode") {
    SECTION("accepts prefixed and unprefixed hex of any case") {
        const Bytes expected{0x60, 0x80, 0x60, 0x40};
        CHECK(parse_bytecode("0x60806040") == expected);
        CHECK(parse_bytecode("60806040") == expected);
        CHECK(parse_bytecode("0X60806040") == expected);
        CHECK(parse_bytecode("0x6080604A") == parse_bytecode("0x6080604a"));
    }
    SECTION("accepts empty payload") {
        CHECK(parse_bytecode("0x") == Bytes{});
        CHECK(parse_bytecode("") == Bytes{});
    }
    SECTION("rejects truncated payload") {
        const auto result{parse_bytecode("0x608")};
        REQUIRE_FALSE(result);
        CHECK(result.error() == BytecodeError::kOddLength);
    }
    SECTION("rejects non-hex payload") {
        const auto result{parse_bytecode("0x60zz")};
        REQUIRE_FALSE(result);
        CHECK(result.error() == BytecodeError::kInvalidDigit);
    }
}

TEST_CASE("decode_or_throw") {
    CHECK(decode_or_throw(RawBytecode{.hex = "0x00ff", .origin = BytecodeOrigin::kBuild}) == Bytes{0x00, 0xff});

    try {
        (void)decode_or_throw(RawBytecode{.hex = "not hex", .origin = BytecodeOrigin::kBuild});
        FAIL("MalformedBytecode expected");
    } catch (const MalformedBytecode& ex) {
        CHECK(ex.origin() == BytecodeOrigin::kBuild);
        CHECK(ex.error() == BytecodeError::kInvalidDigit);
        CHECK(std::string{ex.what()} == "malformed build bytecode: invalid hex digit");
    }
}

}  // namespace provenance
