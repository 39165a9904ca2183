// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "normalizer.hpp"

#include <provenance/core/common/util.hpp>

namespace provenance {

std::optional<size_t> find_metadata_marker(ByteView code, const NormalizerSettings& settings) {
    std::optional<size_t> last;
    for (const auto& marker : settings.markers) {
        if (marker.empty()) continue;
        const auto pos{code.rfind(ByteView{marker})};
        if (pos == ByteView::npos) continue;
        if (!last || pos > *last) {
            last = pos;
        }
    }
    return last;
}

NormalizedBytecode normalize(ByteView raw, const NormalizerSettings& settings) {
    const auto marker_pos{find_metadata_marker(raw, settings)};
    if (!marker_pos) {
        return NormalizedBytecode{Bytes{raw}, 0};
    }
    return NormalizedBytecode{Bytes{raw.substr(0, *marker_pos)}, raw.size() - *marker_pos};
}

const NormalizedBytecode& normalize(const NormalizedBytecode& bytecode, const NormalizerSettings& /*settings*/) noexcept {
    return bytecode;
}

std::string NormalizedBytecode::to_hex(bool with_prefix) const {
    return provenance::to_hex(bytes_, with_prefix);
}

}  // namespace provenance
