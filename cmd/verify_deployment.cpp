// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <memory>

#include <CLI/CLI.hpp>

#include <provenance/build/process.hpp>
#include <provenance/build/source_build_provider.hpp>
#include <provenance/infra/cli/common.hpp>
#include <provenance/infra/common/log.hpp>
#include <provenance/infra/concurrency/worker_pool.hpp>
#include <provenance/rpc/http/client.hpp>
#include <provenance/rpc/json_rpc_trace_source.hpp>
#include <provenance/verifier/cli/verifier_options.hpp>
#include <provenance/verifier/report.hpp>
#include <provenance/verifier/verifier.hpp>

using namespace provenance;

int main(int argc, char* argv[]) {
    CLI::App app{"Verify that a deployed contract was created from the claimed source revision"};

    log::Settings log_settings;
    verifier::VerifierOptions options;
    cmd::common::add_verifier_options(app, options);
    cmd::common::add_logging_options(app, log_settings);

    CLI11_PARSE(app, argc, argv)

    const auto settings{verifier::make_verifier_settings(options)};
    if (!settings) {
        return app.exit(CLI::ValidationError{settings.error()});
    }

    try {
        log::init(log_settings);
        log::set_thread_name("main");

        rpc::JsonRpcTraceSource trace_source{settings->endpoint, std::make_unique<rpc::http::Client>(settings->client)};
        build::BoostProcessRunner process_runner{settings->build.command_timeout};
        build::SourceBuildProvider build_provider{process_runner, settings->build};
        concurrency::WorkerPool workers{concurrency::kDefaultNumWorkers};

        verifier::Verifier verifier{*settings, trace_source, build_provider, workers};
        const auto report{verifier.verify()};
        verifier::render(std::cout, report);
        workers.join();
        return verifier::exit_code(report.result);
    } catch (const verifier::PipelineError& pe) {
        verifier::render(std::cout, pe);
        return verifier::kPipelineFailureExitCode;
    } catch (const std::exception& e) {
        log::Critical() << e.what();
        return verifier::kPipelineFailureExitCode;
    }
}
