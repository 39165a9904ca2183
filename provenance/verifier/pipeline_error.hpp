// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace provenance::verifier {

enum class Stage {
    kTrace,
    kBuild,
    kCompare,
};

struct StageFailure {
    Stage stage{Stage::kTrace};
    std::string reason;  // failure kind, e.g. "MethodUnsupported"
    std::string message;
};

//! Infrastructure failure preventing any classification, listing every failed stage
class PipelineError : public std::runtime_error {
  public:
    explicit PipelineError(std::vector<StageFailure> failures);

    const std::vector<StageFailure>& failures() const noexcept { return failures_; }

  private:
    std::vector<StageFailure> failures_;
};

std::ostream& operator<<(std::ostream& out, Stage stage);
std::ostream& operator<<(std::ostream& out, const StageFailure& failure);

}  // namespace provenance::verifier
