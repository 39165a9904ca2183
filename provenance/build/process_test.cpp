// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "process.hpp"

#include <chrono>
#include <functional>

#include <catch2/catch.hpp>

#include <provenance/build/build_error.hpp>
#include <provenance/infra/common/directories.hpp>
#include <provenance/infra/test_util/log.hpp>

namespace provenance::build {

using namespace std::chrono_literals;

static BuildErrorKind error_kind_of(const std::function<void()>& f) {
    try {
        f();
    } catch (const BuildError& e) {
        return e.kind();
    }
    FAIL("BuildError expected");
    return BuildErrorKind::kBuildFailure;
}

TEST_CASE("BoostProcessRunner", "[build][process]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    BoostProcessRunner runner;

    SECTION("find_program") {
        CHECK(runner.find_program("sh"));
        CHECK_FALSE(runner.find_program("surely-not-an-installed-program"));
    }

    SECTION("captures output and exit code in the working directory") {
        const auto result{runner.run(Command{
            .program = "sh",
            .args = {"-c", "pwd; echo oops >&2; exit 3"},
            .working_dir = tmp_dir.path(),
        })};
        CHECK(result.exit_code == 3);
        CHECK_FALSE(result.succeeded());
        CHECK(std::filesystem::equivalent(std::filesystem::path{result.out.substr(0, result.out.find('\n'))},
                                          tmp_dir.path()));
        CHECK(result.err == "oops\n");
    }

    SECTION("missing program") {
        CHECK(error_kind_of([&] { runner.run(Command{.program = "surely-not-an-installed-program"}); }) ==
              BuildErrorKind::kDependencyMissing);
    }

    SECTION("timeout terminates the child") {
        BoostProcessRunner impatient_runner{200ms};
        const auto start{std::chrono::steady_clock::now()};
        CHECK(error_kind_of([&] {
                  impatient_runner.run(Command{.program = "sh", .args = {"-c", "sleep 10"}, .working_dir = tmp_dir.path()});
              }) == BuildErrorKind::kToolchainError);
        CHECK(std::chrono::steady_clock::now() - start < 5s);
    }

    SECTION("run_checked") {
        CHECK(run_checked(runner, Command{.program = "sh", .args = {"-c", "echo ok"}, .working_dir = tmp_dir.path()}).out ==
              "ok\n");
        try {
            run_checked(runner, Command{.program = "sh", .args = {"-c", "echo compiler error >&2; exit 1"},
                                        .working_dir = tmp_dir.path()});
            FAIL("BuildError expected");
        } catch (const BuildError& e) {
            CHECK(e.kind() == BuildErrorKind::kBuildFailure);
            CHECK(std::string{e.what()} == "sh -c echo compiler error >&2; exit 1 exited with code 1: compiler error");
        }
    }
}

TEST_CASE("Command to_string", "[build][process]") {
    CHECK(to_string(Command{.program = "forge"}) == "forge");
    CHECK(to_string(Command{.program = "forge", .args = {"inspect", "--force", "Token", "bytecode"}}) ==
          "forge inspect --force Token bytecode");
}

}  // namespace provenance::build
