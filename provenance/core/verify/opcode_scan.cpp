// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "opcode_scan.hpp"

namespace provenance {

static OpcodeAdvisory make_advisory(evmc_opcode opcode) {
    static const char* const* kNames{evmc_get_instruction_names_table(EVMC_LATEST_STABLE_REVISION)};
    return OpcodeAdvisory{.opcode = opcode, .name = kNames[opcode]};
}

std::vector<OpcodeAdvisory> scan_opcodes(ByteView code) {
    OpcodeAdvisory delegate_call{make_advisory(OP_DELEGATECALL)};
    OpcodeAdvisory self_destruct{make_advisory(OP_SELFDESTRUCT)};

    for (size_t i{0}; i < code.size();) {
        const auto op{static_cast<evmc_opcode>(code[i])};
        OpcodeAdvisory* advisory{nullptr};
        switch (op) {
            case OP_DELEGATECALL:
                advisory = &delegate_call;
                break;
            case OP_SELFDESTRUCT:
                advisory = &self_destruct;
                break;
            default:
                break;
        }
        if (advisory) {
            if (advisory->occurrences == 0) {
                advisory->first_offset = i;
            }
            ++advisory->occurrences;
        }
        ++i;
        if (op >= OP_PUSH1 && op <= OP_PUSH32) {
            i += static_cast<size_t>(op - OP_PUSH1) + 1;
        }
    }

    std::vector<OpcodeAdvisory> advisories;
    for (const auto& advisory : {self_destruct, delegate_call}) {
        if (advisory.occurrences > 0) {
            advisories.push_back(advisory);
        }
    }
    return advisories;
}

}  // namespace provenance
