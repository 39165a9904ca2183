// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <provenance/build/build_provider.hpp>
#include <provenance/infra/concurrency/worker_pool.hpp>
#include <provenance/rpc/trace_source.hpp>
#include <provenance/verifier/report.hpp>
#include <provenance/verifier/settings.hpp>

namespace provenance::verifier {

//! Deployment-provenance verification of one contract creation against its claimed source
class Verifier {
  public:
    Verifier(VerifierSettings settings, rpc::TraceSource& trace_source, build::BuildProvider& build_provider,
             concurrency::WorkerPool& workers);

    Verifier(const Verifier&) = delete;
    Verifier& operator=(const Verifier&) = delete;

    //! \brief Fetches and locates the on-chain creation while building the claimed source, then compares them
    //! \details Both branches run concurrently and are always awaited. NotFound and Ambiguous are reported without
    //! comparison, unless any branch failed.
    //! \throws PipelineError listing every failed stage
    VerificationReport verify();

  private:
    LocateResult fetch_and_locate();
    RawBytecode build();

    const VerifierSettings settings_;
    rpc::TraceSource& trace_source_;
    build::BuildProvider& build_provider_;
    concurrency::WorkerPool& workers_;
};

}  // namespace provenance::verifier
