// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace provenance::build {

struct Command {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_dir;

    bool operator==(const Command&) const = default;
};

struct ProcessResult {
    int exit_code{0};
    std::string out;
    std::string err;

    bool succeeded() const noexcept { return exit_code == 0; }
};

//! Runs external programs to completion
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    //! \brief Looks up a program on the PATH
    virtual std::optional<std::filesystem::path> find_program(std::string_view name) = 0;

    //! \brief Runs the command, blocking until it exits
    //! \throws BuildError kDependencyMissing if the program is not found, kToolchainError on timeout or spawn failure
    virtual ProcessResult run(const Command& command) = 0;
};

//! ProcessRunner backed by Boost.Process, killing the whole process group on timeout
class BoostProcessRunner : public ProcessRunner {
  public:
    explicit BoostProcessRunner(std::optional<std::chrono::milliseconds> timeout = std::nullopt) : timeout_{timeout} {}

    std::optional<std::filesystem::path> find_program(std::string_view name) override;
    ProcessResult run(const Command& command) override;

  private:
    std::optional<std::chrono::milliseconds> timeout_;
};

//! \brief Runs the command and requires a zero exit code
//! \throws BuildError kBuildFailure carrying the tail of the error output otherwise
ProcessResult run_checked(ProcessRunner& runner, const Command& command);

//! \brief Looks up a program on the PATH
//! \throws BuildError kDependencyMissing if not found
std::filesystem::path require_program(ProcessRunner& runner, std::string_view name);

std::string to_string(const Command& command);

std::ostream& operator<<(std::ostream& out, const Command& command);

}  // namespace provenance::build
