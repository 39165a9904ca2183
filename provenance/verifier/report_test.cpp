// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "report.hpp"

#include <sstream>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <provenance/core/test_util/sample_traces.hpp>

namespace provenance::verifier {

using namespace provenance::test_util;

static constexpr auto kTxHash{0xdf3d25ab26b2bbdc4cc6b5e1b0ca49eb2f0bf0d76c7c62ee92bb63cbe0d5b9a2_bytes32};

static std::string rendered(const VerificationReport& report) {
    std::stringstream ss;
    render(ss, report);
    return ss.str();
}

TEST_CASE("exit_code", "[verifier][report]") {
    CHECK(exit_code(VerificationResult::kMatch) == 0);
    CHECK(exit_code(VerificationResult::kMismatch) == 1);
    CHECK(exit_code(VerificationResult::kNotFound) == 2);
    CHECK(exit_code(VerificationResult::kAmbiguous) == 3);
    CHECK(kPipelineFailureExitCode == 4);
}

TEST_CASE("render VerificationReport", "[verifier][report]") {
    VerificationReport report{.tx_hash = kTxHash, .target = kTargetContract};

    SECTION("not found shows the locator detail") {
        report.result = VerificationResult::kNotFound;
        report.locator_detail = "transaction trace is empty (unknown transaction or node without trace data)";
        const auto text{rendered(report)};
        CHECK(absl::StrContains(text, "Result: NotFound\n"));
        CHECK(absl::StrContains(text, "Contract: 0x5fbdb2315678afecb367f032d93f642f64180aa3\n"));
        CHECK(absl::StrContains(text, "Locator: transaction trace is empty"));
    }

    SECTION("mismatch shows both normalized values and the first difference") {
        const RawBytecode on_chain{.hex = "0x6080604052a264aa", .origin = BytecodeOrigin::kChain};
        const RawBytecode built{.hex = "0x6080604053a264bb", .origin = BytecodeOrigin::kBuild};
        report.comparison = compare(on_chain, built);
        report.result = report.comparison->result;
        report.creation = CreationRecord{.created_address = kTargetContract, .deployer = kDeployer, .trace_address = {0, 1}, .trace_index = 4};
        const auto text{rendered(report)};
        CHECK(absl::StrContains(text, "Result: Mismatch\n"));
        CHECK(absl::StrContains(text, "Creation: trace entry 4 at [0, 1] by 0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266\n"));
        CHECK(absl::StrContains(text, "first difference at byte offset 4\n"));
        CHECK(absl::StrContains(text, "(5 bytes): 0x6080604052\n"));
        CHECK(absl::StrContains(text, "(5 bytes): 0x6080604053\n"));
    }

    SECTION("mismatch on length only") {
        report.comparison = compare(RawBytecode{.hex = "0x6080", .origin = BytecodeOrigin::kChain},
                                    RawBytecode{.hex = "0x608060", .origin = BytecodeOrigin::kBuild});
        report.result = report.comparison->result;
        CHECK(absl::StrContains(rendered(report), "lengths differ after a common prefix of 2 bytes"));
    }

    SECTION("advisories") {
        report.result = VerificationResult::kMatch;
        report.advisories = {OpcodeAdvisory{.opcode = OP_DELEGATECALL, .name = "DELEGATECALL", .first_offset = 17, .occurrences = 2}};
        CHECK(absl::StrContains(rendered(report),
                                "Warning: DELEGATECALL (0xf4) found 2 time(s) in on-chain init code, first at offset 17\n"));
    }
}

TEST_CASE("render PipelineError", "[verifier][report]") {
    const PipelineError error{{
        StageFailure{Stage::kTrace, "MethodUnsupported", "JSON-RPC error -32601: method not found"},
        StageFailure{Stage::kBuild, "DependencyMissing", "required tool not found on PATH: forge"},
    }};
    std::stringstream ss;
    render(ss, error);
    CHECK(ss.str() ==
          "Result: Error\n"
          "Failed stage trace [MethodUnsupported]: JSON-RPC error -32601: method not found\n"
          "Failed stage build [DependencyMissing]: required tool not found on PATH: forge\n");
    CHECK(absl::StrContains(error.what(), "verification failed in 2 stage(s)"));
}

}  // namespace provenance::verifier
