// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <provenance/core/verify/comparator.hpp>
#include <provenance/core/verify/creation_locator.hpp>
#include <provenance/core/verify/opcode_scan.hpp>
#include <provenance/core/verify/verification_result.hpp>
#include <provenance/verifier/pipeline_error.hpp>

namespace provenance::verifier {

//! Process exit status for runs ending with a PipelineError
inline constexpr int kPipelineFailureExitCode{4};

struct VerificationReport {
    VerificationResult result{VerificationResult::kNotFound};
    evmc::bytes32 tx_hash;
    evmc::address target;
    std::string locator_detail;
    std::optional<CreationRecord> creation;
    std::optional<Comparison> comparison;  // present for kMatch and kMismatch
    std::vector<OpcodeAdvisory> advisories;
};

//! \brief Process exit status of a classification: 0 Match, 1 Mismatch, 2 NotFound, 3 Ambiguous
int exit_code(VerificationResult result);

//! \brief Prints the human-readable report: classification, locator detail, mismatch diagnostic and advisories
void render(std::ostream& out, const VerificationReport& report);

//! \brief Prints every failed stage and its reason
void render(std::ostream& out, const PipelineError& error);

}  // namespace provenance::verifier
