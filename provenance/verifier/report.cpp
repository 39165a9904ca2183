// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "report.hpp"

#include <algorithm>
#include <iomanip>

#include <provenance/core/common/util.hpp>
#include <provenance/core/types/address.hpp>
#include <provenance/core/types/evmc_bytes32.hpp>

namespace provenance::verifier {

int exit_code(VerificationResult result) {
    switch (result) {
        case VerificationResult::kMatch:
            return 0;
        case VerificationResult::kMismatch:
            return 1;
        case VerificationResult::kNotFound:
            return 2;
        case VerificationResult::kAmbiguous:
            return 3;
    }
    return kPipelineFailureExitCode;
}

static void render_mismatch(std::ostream& out, const Comparison& comparison) {
    const auto& on_chain{comparison.on_chain};
    const auto& built{comparison.built};
    if (comparison.common_prefix < std::min(on_chain.size(), built.size())) {
        out << "  first difference at byte offset " << comparison.common_prefix << "\n";
    } else {
        out << "  lengths differ after a common prefix of " << comparison.common_prefix << " bytes\n";
    }
    out << "  on-chain normalized (" << on_chain.size() << " bytes): " << on_chain.to_hex() << "\n";
    out << "  built normalized    (" << built.size() << " bytes): " << built.to_hex() << "\n";
}

void render(std::ostream& out, const VerificationReport& report) {
    out << "Result: " << report.result << "\n";
    out << "Transaction: " << to_hex(report.tx_hash, /*with_prefix=*/true) << "\n";
    out << "Contract: " << address_to_hex(report.target) << "\n";

    if (report.creation) {
        const auto& creation{*report.creation};
        out << "Creation: trace entry " << creation.trace_index << " at " << to_string(creation.trace_address);
        if (creation.deployer) {
            out << " by " << address_to_hex(*creation.deployer);
        }
        out << "\n";
    } else {
        out << "Locator: " << report.locator_detail << "\n";
    }

    if (report.comparison) {
        const auto& comparison{*report.comparison};
        out << "Init code: " << comparison.on_chain.size() << " bytes on-chain, " << comparison.built.size()
            << " bytes built (metadata stripped: " << comparison.on_chain.stripped_size() << " / "
            << comparison.built.stripped_size() << " bytes)\n";
        if (report.result == VerificationResult::kMismatch) {
            render_mismatch(out, comparison);
        }
    }

    for (const auto& advisory : report.advisories) {
        out << "Warning: " << advisory.name << " (0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(advisory.opcode) << std::dec << ") found " << advisory.occurrences
            << " time(s) in on-chain init code, first at offset " << advisory.first_offset << "\n";
    }
}

void render(std::ostream& out, const PipelineError& error) {
    out << "Result: Error\n";
    for (const auto& failure : error.failures()) {
        out << "Failed stage " << failure << "\n";
    }
}

}  // namespace provenance::verifier
