// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <evmc/instructions.h>

#include <provenance/core/common/bytes.hpp>

namespace provenance {

//! Occurrences of an opcode deserving the attention of an auditor
struct OpcodeAdvisory {
    evmc_opcode opcode{OP_STOP};
    std::string_view name;  // from the evmc instruction names table
    size_t first_offset{0};
    size_t occurrences{0};
};

//! \brief Linear scan of code for SELFDESTRUCT and DELEGATECALL, skipping PUSH immediates
//! \remarks Purely informational: data embedded in code (e.g. the runtime code carried by init code) is decoded as
//! instructions too
std::vector<OpcodeAdvisory> scan_opcodes(ByteView code);

}  // namespace provenance
