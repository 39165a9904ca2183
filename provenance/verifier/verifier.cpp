// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier.hpp"

#include <future>
#include <optional>
#include <sstream>

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <provenance/build/build_error.hpp>
#include <provenance/core/types/address.hpp>
#include <provenance/core/types/evmc_bytes32.hpp>
#include <provenance/infra/common/ensure.hpp>
#include <provenance/infra/common/log.hpp>
#include <provenance/rpc/common/rpc_error.hpp>

namespace provenance::verifier {

template <typename Kind>
static std::string kind_name(Kind kind) {
    std::stringstream ss;
    ss << kind;
    return ss.str();
}

//! Awaits a branch and records its failure, if any
template <typename T>
static std::optional<T> await_branch(std::future<T>& branch, Stage stage, std::vector<StageFailure>& failures) {
    try {
        return branch.get();
    } catch (const rpc::RpcError& e) {
        failures.push_back({stage, kind_name(e.kind()), e.what()});
    } catch (const build::BuildError& e) {
        failures.push_back({stage, kind_name(e.kind()), e.what()});
    } catch (const std::exception& e) {
        failures.push_back({stage, "Unexpected", e.what()});
    }
    return std::nullopt;
}

Verifier::Verifier(VerifierSettings settings, rpc::TraceSource& trace_source, build::BuildProvider& build_provider,
                   concurrency::WorkerPool& workers)
    : settings_{std::move(settings)}, trace_source_{trace_source}, build_provider_{build_provider}, workers_{workers} {}

LocateResult Verifier::fetch_and_locate() {
    log::set_thread_name("trace");
    const auto traces{trace_source_.fetch_trace(settings_.tx_hash)};
    PROV_INFO_M("Trace fetched", {"entries", std::to_string(traces.size())});
    return locate_creation(traces, settings_.target);
}

RawBytecode Verifier::build() {
    log::set_thread_name("build");
    return build_provider_.build(settings_.source, settings_.contract_name);
}

VerificationReport Verifier::verify() {
    PROV_INFO_M("Verification started", {"tx", to_hex(settings_.tx_hash, true), "contract", address_to_hex(settings_.target),
                                         "endpoint", to_string(settings_.endpoint)});

    auto trace_branch = boost::asio::post(workers_, boost::asio::use_future([this] { return fetch_and_locate(); }));
    auto build_branch = boost::asio::post(workers_, boost::asio::use_future([this] { return build(); }));

    std::vector<StageFailure> failures;
    auto located_or_none{await_branch(trace_branch, Stage::kTrace, failures)};
    auto built{await_branch(build_branch, Stage::kBuild, failures)};
    if (!failures.empty()) {
        for (const auto& failure : failures) {
            PROV_ERROR_M("Stage failed", {"stage", kind_name(failure.stage), "reason", failure.reason});
        }
        throw PipelineError{std::move(failures)};
    }

    VerificationReport report{
        .tx_hash = settings_.tx_hash,
        .target = settings_.target,
    };

    const auto& located{*located_or_none};
    if (!located) {
        report.result = located.error().error == LocateError::kAmbiguous ? VerificationResult::kAmbiguous
                                                                          : VerificationResult::kNotFound;
        report.locator_detail = describe(located.error());
        PROV_INFO_M("Creation not located", {"result", kind_name(report.result), "detail", report.locator_detail});
        return report;
    }
    ensure_invariant(located->created_address == settings_.target, [&] {
        return "located creation of " + address_to_hex(located->created_address) + " instead of " +
               address_to_hex(settings_.target);
    });
    report.creation = *located;
    PROV_INFO_M("Creation located", {"index", std::to_string(located->trace_index),
                                     "trace_address", to_string(located->trace_address)});

    try {
        if (!located->init_code) {
            throw MalformedBytecode{BytecodeOrigin::kChain, BytecodeError::kMissing};
        }
        report.comparison = compare(RawBytecode{.hex = *located->init_code, .origin = BytecodeOrigin::kChain}, *built,
                                    settings_.normalizer);
    } catch (const MalformedBytecode& e) {
        PROV_ERROR_M("Stage failed", {"stage", "compare", "reason", kind_name(e.error())});
        throw PipelineError{{StageFailure{Stage::kCompare, "MalformedBytecode", e.what()}}};
    }
    report.result = report.comparison->result;

    report.advisories = scan_opcodes(report.comparison->on_chain.bytes());
    for (const auto& advisory : report.advisories) {
        PROV_WARN_M("Opcode found in on-chain init code",
                    {"opcode", std::string{advisory.name}, "occurrences", std::to_string(advisory.occurrences)});
    }

    PROV_INFO_M("Verification completed", {"result", kind_name(report.result)});
    return report;
}

}  // namespace provenance::verifier
