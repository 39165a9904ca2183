// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <provenance/build/settings.hpp>
#include <provenance/build/source_checkout.hpp>
#include <provenance/core/verify/normalizer.hpp>
#include <provenance/rpc/common/endpoint.hpp>
#include <provenance/rpc/settings.hpp>

namespace provenance::verifier {

//! Verification inputs as given on the command line
struct VerifierOptions {
    std::string tx_hash;
    std::string address;
    std::string rpc_url;
    std::string git_url;
    std::optional<std::string> commit;
    std::string contract_name;
    std::vector<std::string> metadata_markers;  // replace the default marker when not empty
    uint32_t rpc_timeout_secs{static_cast<uint32_t>(rpc::kDefaultRequestTimeout.count())};
    std::optional<uint32_t> build_timeout_secs;
    std::optional<std::string> build_tmpdir;
};

//! Validated verification inputs
struct VerifierSettings {
    evmc::bytes32 tx_hash;
    evmc::address target;
    rpc::Endpoint endpoint;
    build::SourceRevision source;
    std::string contract_name;
    NormalizerSettings normalizer;
    rpc::ClientSettings client;
    build::BuildSettings build;
};

//! \brief Validates the options once: 32-byte hash, 20-byte address, http(s) endpoint, non-empty names and markers
//! \return the settings or a message naming the first invalid option
tl::expected<VerifierSettings, std::string> make_verifier_settings(const VerifierOptions& options);

//! \brief Decodes a metadata marker given as hex (e.g. "0xa264")
std::optional<Bytes> parse_metadata_marker(std::string_view hex);

}  // namespace provenance::verifier
