// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier_options.hpp"

#include <provenance/core/common/base.hpp>
#include <provenance/core/common/util.hpp>
#include <provenance/rpc/common/endpoint.hpp>

namespace provenance::cmd::common {

FixedHexValidator::FixedHexValidator(size_t num_bytes, std::string_view what) {
    name_ = "HEX" + std::to_string(num_bytes);
    func_ = [num_bytes, what = std::string{what}](const std::string& value) -> std::string {
        if (value.size() != 2 + 2 * num_bytes || !is_valid_hex(value)) {
            return "Value " + value + " is not a valid " + what + " (0x followed by " + std::to_string(2 * num_bytes) +
                   " hex digits)";
        }
        return {};
    };
}

EndpointValidator::EndpointValidator() {
    name_ = "URL";
    func_ = [](const std::string& value) -> std::string {
        if (!rpc::parse_endpoint(value)) {
            return "Value " + value + " is not a valid http:// or https:// endpoint";
        }
        return {};
    };
}

MetadataMarkerValidator::MetadataMarkerValidator() {
    name_ = "HEX";
    func_ = [](const std::string& value) -> std::string {
        if (!verifier::parse_metadata_marker(value)) {
            return "Value " + value + " is not a valid metadata marker (non-empty even-length hex)";
        }
        return {};
    };
}

void add_verifier_options(CLI::App& cli, verifier::VerifierOptions& options) {
    cli.add_option("--tx", options.tx_hash)
        ->description("Hash of the transaction deploying the contract")
        ->required()
        ->check(FixedHexValidator{kHashLength, "transaction hash"});

    cli.add_option("--address", options.address)
        ->description("Address of the deployed contract")
        ->required()
        ->check(FixedHexValidator{kAddressLength, "address"});

    cli.add_option("--rpc", options.rpc_url)
        ->description("JSON-RPC endpoint of a node exposing trace_transaction, e.g. http://localhost:8545")
        ->required()
        ->check(EndpointValidator{});

    cli.add_option("--git", options.git_url)
        ->description("URL of the git repository holding the claimed source")
        ->required();

    cli.add_option("--commit", options.commit)
        ->description("Revision of the claimed source (commit hash, tag or branch), default branch if omitted or empty");

    cli.add_option("--contract", options.contract_name)
        ->description("Name of the contract to compile, fully qualified (e.g. contracts/A.sol:A) if ambiguous")
        ->required();

    auto& advanced_opts = *cli.add_option_group("Verification", "Verification tuning options");
    advanced_opts.add_option("--metadata.marker", options.metadata_markers)
        ->description("Hex marker of the compiler metadata section, repeatable (default: 0xa264)")
        ->check(MetadataMarkerValidator{});

    advanced_opts.add_option("--rpc.timeout", options.rpc_timeout_secs)
        ->description("Timeout in seconds for connecting to and exchanging data with the node")
        ->check(CLI::Range(1u, 3600u))
        ->capture_default_str();

    advanced_opts.add_option("--build.timeout", options.build_timeout_secs)
        ->description("Timeout in seconds for each external build command (none if omitted)")
        ->check(CLI::Range(1u, 86400u));

    advanced_opts.add_option("--build.tmpdir", options.build_tmpdir)
        ->description("Base directory for temporary checkouts (OS temporary directory if omitted)")
        ->check(CLI::ExistingDirectory);
}

}  // namespace provenance::cmd::common
