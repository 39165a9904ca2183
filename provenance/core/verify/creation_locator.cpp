// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "creation_locator.hpp"

#include <magic_enum.hpp>

namespace provenance {

LocateResult locate_creation(const TraceEntries& traces, const evmc::address& target) {
    LocateFailure stats{.total_entries = traces.size()};
    std::optional<size_t> selected;

    for (size_t i{0}; i < traces.size(); ++i) {
        const auto& entry{traces[i]};
        if (entry.action_type != ActionType::kCreate) continue;
        ++stats.creations;

        // Reverted or failed creations carry no result hence no address
        if (!entry.has_result()) {
            ++stats.creations_without_result;
            continue;
        }
        if (entry.created_address() != target) continue;

        ++stats.matches;
        if (!selected) {
            selected = i;
        }
    }

    if (stats.matches == 0) {
        stats.error = LocateError::kNotFound;
        return tl::make_unexpected(stats);
    }
    if (stats.matches > 1) {
        stats.error = LocateError::kAmbiguous;
        return tl::make_unexpected(stats);
    }

    const auto& entry{traces[*selected]};
    return CreationRecord{
        .created_address = target,
        .init_code = entry.init_code(),
        .deployer = entry.action.from,
        .trace_address = entry.trace_address,
        .trace_index = *selected,
    };
}

std::string describe(const LocateFailure& failure) {
    switch (failure.error) {
        case LocateError::kAmbiguous:
            return "target address created " + std::to_string(failure.matches) +
                   " times in the same transaction (self-destruct and re-create or trace anomaly)";
        case LocateError::kNotFound:
            if (failure.total_entries == 0) {
                return "transaction trace is empty (unknown transaction or node without trace data)";
            }
            if (failure.creations == 0) {
                return "transaction performs no contract creation (" + std::to_string(failure.total_entries) + " trace entries)";
            }
            if (failure.creations_without_result > 0) {
                return "target address not created by this transaction; " + std::to_string(failure.creations_without_result) +
                       " of " + std::to_string(failure.creations) + " creation(s) carry no result";
            }
            return "target address not created by this transaction (" + std::to_string(failure.creations) + " creation(s) inspected)";
    }
    return {};
}

std::ostream& operator<<(std::ostream& out, LocateError error) {
    out << magic_enum::enum_name(error);
    return out;
}

}  // namespace provenance
