// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <provenance/core/common/bytes.hpp>

namespace provenance {

//! Start of the CBOR metadata map appended by solc (a2 64 -> map(2), text(4) "ipfs")
inline const Bytes kDefaultMetadataMarker{0xa2, 0x64};

struct NormalizerSettings {
    //! Byte sequences denoting the start of an embedded metadata section, compiler specific
    std::vector<Bytes> markers{kDefaultMetadataMarker};
};

class NormalizedBytecode;

//! \brief Strips the trailing metadata section from bytecode
//! \details Truncates strictly before the last byte-aligned occurrence of any configured marker; bytecode with no
//! marker is returned unchanged
//! \warning A marker sequence occurring inside genuine code (i.e. not metadata) makes this truncate too much
NormalizedBytecode normalize(ByteView raw, const NormalizerSettings& settings = {});

//! \brief Normalizing already normalized bytecode is a no-op
const NormalizedBytecode& normalize(const NormalizedBytecode& bytecode, const NormalizerSettings& settings = {}) noexcept;

//! \brief Returns the offset of the last occurrence of any marker, if any
std::optional<size_t> find_metadata_marker(ByteView code, const NormalizerSettings& settings);

//! Bytecode with its trailing metadata section removed, only obtainable through normalize
class NormalizedBytecode {
  public:
    ByteView bytes() const noexcept { return bytes_; }
    size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

    //! Number of trailing bytes dropped by normalization
    size_t stripped_size() const noexcept { return stripped_size_; }

    std::string to_hex(bool with_prefix = true) const;

    friend bool operator==(const NormalizedBytecode& lhs, const NormalizedBytecode& rhs) noexcept {
        return lhs.bytes_ == rhs.bytes_;
    }

  private:
    friend NormalizedBytecode normalize(ByteView raw, const NormalizerSettings& settings);

    NormalizedBytecode(Bytes bytes, size_t stripped_size) : bytes_{std::move(bytes)}, stripped_size_{stripped_size} {}

    Bytes bytes_;
    size_t stripped_size_{0};
};

}  // namespace provenance
