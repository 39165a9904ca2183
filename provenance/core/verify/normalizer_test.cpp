// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "normalizer.hpp"

#include <catch2/catch.hpp>

#include <provenance/core/common/util.hpp>

namespace provenance {

static Bytes hex(std::string_view in) {
    return *from_hex(in);
}

TEST_CASE("normalize: metadata is stripped") {
    const Bytes code{hex("6080604052348015600f57600080fd5b50")};
    const Bytes metadata{hex("a264697066735822122012345678")};

    const auto normalized{normalize(code + metadata)};
    CHECK(normalized.bytes() == ByteView{code});
    CHECK(normalized.stripped_size() == metadata.size());
    CHECK(normalized.to_hex() == "0x6080604052348015600f57600080fd5b50");
}

TEST_CASE("normalize: no marker leaves input unchanged") {
    const std::vector<Bytes> inputs{
        Bytes{},
        hex("00"),
        hex("a2"),
        hex("64a2"),
        hex("6080604052348015600f57600080fd5b50"),
    };
    for (const auto& input : inputs) {
        const auto normalized{normalize(input)};
        CHECK(normalized.bytes() == ByteView{input});
        CHECK(normalized.stripped_size() == 0);
    }
}

TEST_CASE("normalize: truncates before the marker") {
    const Bytes x{hex("60806040")};
    const Bytes y{hex("697066735822")};
    CHECK(normalize(x + kDefaultMetadataMarker + y).bytes() == ByteView{x});
    CHECK(normalize(x + kDefaultMetadataMarker).bytes() == ByteView{x});
    CHECK(normalize(kDefaultMetadataMarker + y).empty());
}

TEST_CASE("normalize: marker is searched on byte boundaries") {
    // 0a 26 4f contains the digits "a264" across byte boundaries but not the bytes a2 64
    const Bytes code{hex("600a264f00")};
    CHECK(normalize(code).bytes() == ByteView{code});
}

TEST_CASE("normalize: last occurrence wins") {
    // Init code embedding a runtime code with its own metadata, followed by the outer metadata
    const Bytes prefix{hex("6080")};
    const Bytes inner{hex("a264aaaa")};
    const Bytes middle{hex("6040")};
    const Bytes outer{hex("a264bbbb")};

    CHECK(normalize(prefix + inner + middle + outer).bytes() == ByteView{prefix + inner + middle});
}

TEST_CASE("normalize: idempotence") {
    const std::vector<Bytes> inputs{
        Bytes{},
        hex("60806040"),
        hex("60806040a2646970667358"),
        hex("a264"),
        hex("6080a264aaaa6040a264bbbb"),
    };
    for (const auto& input : inputs) {
        const auto once{normalize(input)};
        const auto& twice{normalize(once)};
        CHECK(twice == once);
    }

    SECTION("re-normalizing the bytes of a value with at most one marker is a fixpoint") {
        for (const auto& input : {hex("60806040"), hex("60806040a2646970667358")}) {
            const auto once{normalize(input)};
            CHECK(normalize(once.bytes()) == once);
        }
    }

    SECTION("raw re-normalization of several markers truncates again, the typed value does not") {
        const auto once{normalize(hex("6080a264aaaa6040a264bbbb"))};
        CHECK(once.bytes() == ByteView{hex("6080a264aaaa6040")});
        CHECK(normalize(once) == once);
        CHECK(normalize(once.bytes()).bytes() == ByteView{hex("6080")});
    }

    SECTION("known limitation: a marker inside genuine code over-truncates") {
        // 61a264 is PUSH2 0xa264, i.e. the marker appears in executable code
        const Bytes code{hex("61a26450")};
        const Bytes metadata{hex("a2646970")};
        const auto once{normalize(code + metadata)};
        CHECK(once.bytes() == ByteView{code});
        CHECK(normalize(once.bytes()).bytes() == ByteView{hex("61")});
    }
}

TEST_CASE("normalize: configurable markers") {
    const Bytes bzzr0_marker{hex("a165627a7a7230")};  // solc 0.4.x swarm metadata
    const Bytes code{hex("6080604052")};
    const Bytes metadata{bzzr0_marker + hex("5820aabbcc0029")};

    SECTION("default marker does not recognize legacy metadata") {
        CHECK(normalize(code + metadata).bytes() == ByteView{code + metadata});
    }
    SECTION("custom marker") {
        NormalizerSettings settings{.markers = {bzzr0_marker}};
        CHECK(normalize(code + metadata, settings).bytes() == ByteView{code});
    }
    SECTION("several markers pick the last position over all of them") {
        NormalizerSettings settings{.markers = {kDefaultMetadataMarker, bzzr0_marker}};
        CHECK(normalize(code + kDefaultMetadataMarker + code + metadata, settings).bytes() ==
              ByteView{code + kDefaultMetadataMarker + code});
    }
    SECTION("empty markers are ignored") {
        NormalizerSettings settings{.markers = {Bytes{}}};
        CHECK(normalize(code, settings).bytes() == ByteView{code});
        CHECK_FALSE(find_metadata_marker(code, settings));
    }
}

}  // namespace provenance
