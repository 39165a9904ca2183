// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "opcode_scan.hpp"

#include <catch2/catch.hpp>

#include <provenance/core/common/util.hpp>

namespace provenance {

TEST_CASE("scan_opcodes") {
    SECTION("clean code") {
        CHECK(scan_opcodes(*from_hex("6080604052600080fd")).empty());
        CHECK(scan_opcodes(Bytes{}).empty());
    }

    SECTION("push immediates are skipped") {
        // PUSH1 0xff, PUSH2 0xf4ff, PUSH32 full of 0xff
        const Bytes code{*from_hex("60ff61f4ff7f" + std::string(64, 'f') + "00")};
        CHECK(scan_opcodes(code).empty());
    }

    SECTION("selfdestruct and delegatecall are reported") {
        // PUSH1 0x00 SELFDESTRUCT ... DELEGATECALL ... SELFDESTRUCT
        const auto advisories{scan_opcodes(*from_hex("6000ff5af45bff"))};
        REQUIRE(advisories.size() == 2);
        CHECK(advisories[0].opcode == OP_SELFDESTRUCT);
        CHECK(advisories[0].name == "SELFDESTRUCT");
        CHECK(advisories[0].first_offset == 2);
        CHECK(advisories[0].occurrences == 2);
        CHECK(advisories[1].opcode == OP_DELEGATECALL);
        CHECK(advisories[1].name == "DELEGATECALL");
        CHECK(advisories[1].first_offset == 4);
        CHECK(advisories[1].occurrences == 1);
    }

    SECTION("names come from the instruction table") {
        const auto* names{evmc_get_instruction_names_table(EVMC_LATEST_STABLE_REVISION)};
        const auto advisories{scan_opcodes(*from_hex("f4ff"))};
        REQUIRE(advisories.size() == 2);
        CHECK(advisories[0].name == names[OP_SELFDESTRUCT]);
        CHECK(advisories[1].name == names[OP_DELEGATECALL]);
    }

    SECTION("every push width is skipped") {
        for (int op = OP_PUSH1; op <= OP_PUSH32; ++op) {
            const size_t width{static_cast<size_t>(op - OP_PUSH1) + 1};
            Bytes code{static_cast<uint8_t>(op)};
            code.append(width, OP_SELFDESTRUCT);
            code.push_back(OP_DELEGATECALL);
            const auto advisories{scan_opcodes(code)};
            REQUIRE(advisories.size() == 1);
            CHECK(advisories[0].opcode == OP_DELEGATECALL);
            CHECK(advisories[0].first_offset == width + 1);
        }
    }

    SECTION("truncated push at end of code") {
        CHECK(scan_opcodes(*from_hex("7fff")).empty());
    }
}

}  // namespace provenance
