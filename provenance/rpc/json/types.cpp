// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <charconv>
#include <string>
#include <system_error>

#include <provenance/core/common/util.hpp>
#include <provenance/core/types/address.hpp>
#include <provenance/core/types/evmc_bytes32.hpp>

namespace evmc {

void from_json(const nlohmann::json& json, address& addr) {
    if (!json.is_string()) {
        provenance::rpc::throw_invalid_field("address", json);
    }
    const auto parsed{provenance::hex_to_address(json.get<std::string>())};
    if (!parsed) {
        provenance::rpc::throw_invalid_field("address", json);
    }
    addr = *parsed;
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    if (!json.is_string()) {
        provenance::rpc::throw_invalid_field("bytes32", json);
    }
    const auto parsed{provenance::hex_to_bytes32(json.get<std::string>())};
    if (!parsed) {
        provenance::rpc::throw_invalid_field("bytes32", json);
    }
    b32 = *parsed;
}

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    if (json.is_number_unsigned()) {
        ui256 = json.get<uint64_t>();
        return;
    }
    if (!json.is_string() || !provenance::is_valid_hex(json.get<std::string>())) {
        provenance::rpc::throw_invalid_field("uint256", json);
    }
    try {
        ui256 = intx::from_string<intx::uint256>(json.get<std::string>());
    } catch (const std::out_of_range&) {
        provenance::rpc::throw_invalid_field("uint256", json);
    }
}

}  // namespace intx

namespace provenance::rpc {

uint64_t from_quantity(const nlohmann::json& json) {
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    if (!json.is_string()) {
        throw_invalid_field("quantity", json);
    }
    const auto& text{json.get_ref<const std::string&>()};
    if (!is_valid_hex(text)) {
        throw_invalid_field("quantity", json);
    }
    uint64_t value{0};
    const auto [ptr, ec] = std::from_chars(text.data() + 2, text.data() + text.size(), value, 16);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw_invalid_field("quantity", json);
    }
    return value;
}

void throw_invalid_field(std::string_view field, const nlohmann::json& json) {
    throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                            "invalid " + std::string{field} + ": " + abridge(json.dump(), 80)};
}

}  // namespace provenance::rpc
