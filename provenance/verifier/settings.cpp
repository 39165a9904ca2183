// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <absl/strings/ascii.h>

#include <provenance/core/types/address.hpp>
#include <provenance/core/types/evmc_bytes32.hpp>
#include <provenance/core/verify/bytecode.hpp>

namespace provenance::verifier {

std::optional<Bytes> parse_metadata_marker(std::string_view hex) {
    auto bytes{parse_bytecode(hex)};
    if (!bytes || bytes->empty()) {
        return std::nullopt;
    }
    return std::move(*bytes);
}

tl::expected<VerifierSettings, std::string> make_verifier_settings(const VerifierOptions& options) {
    VerifierSettings settings;

    const auto tx_hash{hex_to_bytes32(options.tx_hash)};
    if (!tx_hash) {
        return tl::make_unexpected("--tx: " + options.tx_hash + " is not a 0x-prefixed 32-byte transaction hash");
    }
    settings.tx_hash = *tx_hash;

    const auto target{hex_to_address(options.address)};
    if (!target) {
        return tl::make_unexpected("--address: " + options.address + " is not a 0x-prefixed 20-byte address");
    }
    settings.target = *target;

    auto endpoint{rpc::parse_endpoint(options.rpc_url)};
    if (!endpoint) {
        return tl::make_unexpected("--rpc: " + options.rpc_url + " is not an http:// or https:// URL");
    }
    settings.endpoint = std::move(*endpoint);

    if (absl::StripAsciiWhitespace(options.git_url).empty()) {
        return tl::make_unexpected(std::string{"--git: repository URL is empty"});
    }
    settings.source.repository_url = options.git_url;
    // An empty revision means no pin: the default branch is built
    if (options.commit && !absl::StripAsciiWhitespace(*options.commit).empty()) {
        settings.source.revision = options.commit;
    }

    if (absl::StripAsciiWhitespace(options.contract_name).empty()) {
        return tl::make_unexpected(std::string{"--contract: contract name is empty"});
    }
    settings.contract_name = options.contract_name;

    if (!options.metadata_markers.empty()) {
        settings.normalizer.markers.clear();
        for (const auto& marker_hex : options.metadata_markers) {
            auto marker{parse_metadata_marker(marker_hex)};
            if (!marker) {
                return tl::make_unexpected("--metadata.marker: " + marker_hex + " is not a non-empty hex byte sequence");
            }
            settings.normalizer.markers.push_back(std::move(*marker));
        }
    }

    if (options.rpc_timeout_secs == 0) {
        return tl::make_unexpected(std::string{"--rpc.timeout: must be positive"});
    }
    settings.client.request_timeout = std::chrono::seconds{options.rpc_timeout_secs};
    if (options.build_timeout_secs) {
        if (*options.build_timeout_secs == 0) {
            return tl::make_unexpected(std::string{"--build.timeout: must be positive"});
        }
        settings.build.command_timeout = std::chrono::seconds{*options.build_timeout_secs};
    }
    if (options.build_tmpdir) {
        settings.build.temp_dir = std::filesystem::path{*options.build_tmpdir};
    }

    return settings;
}

}  // namespace provenance::verifier
