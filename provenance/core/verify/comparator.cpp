// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "comparator.hpp"

#include <provenance/core/common/util.hpp>

namespace provenance {

Comparison compare(const RawBytecode& on_chain, const RawBytecode& built, const NormalizerSettings& settings) {
    const Bytes on_chain_bytes{decode_or_throw(on_chain)};
    const Bytes built_bytes{decode_or_throw(built)};

    auto on_chain_normalized{normalize(on_chain_bytes, settings)};
    auto built_normalized{normalize(built_bytes, settings)};

    const bool equal{on_chain_normalized == built_normalized};
    const size_t common_prefix{prefix_length(on_chain_normalized.bytes(), built_normalized.bytes())};
    return Comparison{
        .result = equal ? VerificationResult::kMatch : VerificationResult::kMismatch,
        .on_chain = std::move(on_chain_normalized),
        .built = std::move(built_normalized),
        .common_prefix = common_prefix,
    };
}

}  // namespace provenance
