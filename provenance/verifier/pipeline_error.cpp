// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pipeline_error.hpp"

#include <sstream>

#include <absl/strings/ascii.h>
#include <magic_enum.hpp>

namespace provenance::verifier {

static std::string summarize(const std::vector<StageFailure>& failures) {
    std::stringstream ss;
    ss << "verification failed in " << failures.size() << " stage(s)";
    for (const auto& failure : failures) {
        ss << "; " << failure;
    }
    return ss.str();
}

PipelineError::PipelineError(std::vector<StageFailure> failures)
    : std::runtime_error{summarize(failures)}, failures_{std::move(failures)} {}

std::ostream& operator<<(std::ostream& out, Stage stage) {
    out << absl::AsciiStrToLower(std::string{magic_enum::enum_name(stage).substr(1)});
    return out;
}

std::ostream& operator<<(std::ostream& out, const StageFailure& failure) {
    out << failure.stage << " [" << failure.reason << "]: " << failure.message;
    return out;
}

}  // namespace provenance::verifier
