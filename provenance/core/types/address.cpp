// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <provenance/core/common/util.hpp>

namespace provenance {

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    if (!is_valid_address(hex)) {
        return std::nullopt;
    }
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

}  // namespace provenance

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << provenance::address_to_hex(address);
}

}  // namespace evmc
