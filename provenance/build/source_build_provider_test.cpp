// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "source_build_provider.hpp"

#include <fstream>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <provenance/build/build_error.hpp>
#include <provenance/build/test_util/mock_process_runner.hpp>
#include <provenance/infra/common/directories.hpp>
#include <provenance/infra/test_util/log.hpp>

namespace provenance::build {

using testing::_;
using testing::Field;
using testing::Return;

static const std::string kRepository{"https://github.com/example/token.git"};

//! Simulates git clone by creating the destination directory with the given root files
static auto clone_with(std::vector<std::string> files, std::filesystem::path* clone_path) {
    return [files = std::move(files), clone_path](const Command& command) {
        const std::filesystem::path dest{command.args.back()};
        std::filesystem::create_directories(dest);
        for (const auto& file : files) {
            std::ofstream{dest / file} << "{}";
        }
        *clone_path = dest;
        return ProcessResult{};
    };
}

TEST_CASE("SourceBuildProvider", "[build][source_build_provider]") {
    provenance::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory base_dir;
    testing::NiceMock<test_util::MockProcessRunner> runner;
    runner.install({"git", "forge", "npm", "npx"});
    SourceBuildProvider provider{runner, BuildSettings{.temp_dir = base_dir.path()}};
    std::filesystem::path clone_path;

    SECTION("foundry project at a pinned revision") {
        testing::InSequence sequence;
        EXPECT_CALL(runner, run(Field(&Command::program, "git")))
            .WillOnce([&](const Command& command) {
                CHECK(command.args[0] == "clone");
                CHECK(command.args[command.args.size() - 2] == kRepository);
                return clone_with({"foundry.toml"}, &clone_path)(command);
            });
        EXPECT_CALL(runner, run(Field(&Command::program, "git")))
            .WillOnce([&](const Command& command) {
                CHECK(command.args == std::vector<std::string>{"checkout", "--quiet", "--detach", "v1.0.0"});
                CHECK(command.working_dir == clone_path);
                return ProcessResult{};
            });
        EXPECT_CALL(runner, run(Field(&Command::args, std::vector<std::string>{"install"}))).WillOnce(Return(ProcessResult{}));
        EXPECT_CALL(runner, run(Field(&Command::args, std::vector<std::string>{"inspect", "--force", "Token", "bytecode"})))
            .WillOnce(Return(ProcessResult{0, "0x6080604052\n", ""}));

        const auto built{provider.build(SourceRevision{kRepository, "v1.0.0"}, "Token")};
        CHECK(built.hex == "0x6080604052");
        CHECK(built.origin == BytecodeOrigin::kBuild);
        CHECK(clone_path.parent_path().parent_path() == base_dir.path());
        CHECK_FALSE(std::filesystem::exists(clone_path.parent_path()));
    }

    SECTION("no revision pin skips checkout") {
        EXPECT_CALL(runner, run(Field(&Command::program, "git"))).WillOnce(clone_with({"foundry.toml"}, &clone_path));
        EXPECT_CALL(runner, run(Field(&Command::program, "forge")))
            .WillOnce(Return(ProcessResult{}))
            .WillOnce(Return(ProcessResult{0, "0x00", ""}));
        CHECK(provider.build(SourceRevision{kRepository, std::nullopt}, "Token").hex == "0x00");
    }

    SECTION("unsupported layout removes the checkout") {
        EXPECT_CALL(runner, run(Field(&Command::program, "git"))).WillOnce(clone_with({"Makefile"}, &clone_path));
        try {
            provider.build(SourceRevision{kRepository, std::nullopt}, "Token");
            FAIL("BuildError expected");
        } catch (const BuildError& e) {
            CHECK(e.kind() == BuildErrorKind::kBuildFailure);
            CHECK(std::string{e.what()}.starts_with("unsupported project layout"));
        }
        CHECK_FALSE(std::filesystem::exists(clone_path));
        CHECK(base_dir.is_empty());
    }

    SECTION("failing clone") {
        EXPECT_CALL(runner, run(Field(&Command::program, "git")))
            .WillOnce(Return(ProcessResult{128, "", "fatal: repository not found"}));
        try {
            provider.build(SourceRevision{kRepository, std::nullopt}, "Token");
            FAIL("BuildError expected");
        } catch (const BuildError& e) {
            CHECK(e.kind() == BuildErrorKind::kBuildFailure);
            CHECK(std::string{e.what()}.ends_with("fatal: repository not found"));
        }
        CHECK(base_dir.is_empty());
    }

    SECTION("git not installed") {
        testing::NiceMock<test_util::MockProcessRunner> bare_runner;
        SourceBuildProvider bare_provider{bare_runner, BuildSettings{.temp_dir = base_dir.path()}};
        EXPECT_CALL(bare_runner, run(_)).Times(0);
        try {
            bare_provider.build(SourceRevision{kRepository, std::nullopt}, "Token");
            FAIL("BuildError expected");
        } catch (const BuildError& e) {
            CHECK(e.kind() == BuildErrorKind::kDependencyMissing);
        }
    }

    SECTION("empty contract name") {
        EXPECT_CALL(runner, run(_)).Times(0);
        CHECK_THROWS_AS(provider.build(SourceRevision{kRepository, std::nullopt}, ""), std::logic_error);
        CHECK(base_dir.is_empty());
    }

    SECTION("hardhat project") {
        EXPECT_CALL(runner, run(Field(&Command::program, "git")))
            .WillOnce(clone_with({"package.json", "hardhat.config.ts"}, &clone_path));
        EXPECT_CALL(runner, run(Field(&Command::program, "npm"))).WillOnce(Return(ProcessResult{}));
        EXPECT_CALL(runner, run(Field(&Command::program, "npx"))).WillOnce([&](const Command& command) {
            const auto artifact{command.working_dir / "artifacts" / "contracts" / "Token.sol" / "Token.json"};
            std::filesystem::create_directories(artifact.parent_path());
            std::ofstream{artifact} << R"({"bytecode": "0x6080604052"})";
            return ProcessResult{};
        });
        CHECK(provider.build(SourceRevision{kRepository, std::nullopt}, "Token").hex == "0x6080604052");
    }
}

}  // namespace provenance::build
