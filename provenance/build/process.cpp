// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "process.hpp"

#include <future>

#include <absl/strings/str_join.h>
#include <absl/strings/strip.h>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <provenance/build/build_error.hpp>
#include <provenance/infra/common/log.hpp>

namespace provenance::build {

namespace bp = boost::process;

//! Maximum length of the error output quoted in a failure
static constexpr size_t kErrorTailLength{800};

static std::string tail(std::string_view text, size_t length) {
    const absl::string_view stripped{absl::StripTrailingAsciiWhitespace(absl::string_view{text.data(), text.size()})};
    text = std::string_view{stripped.data(), stripped.size()};
    if (text.size() <= length) {
        return std::string{text};
    }
    return "..." + std::string{text.substr(text.size() - length)};
}

std::optional<std::filesystem::path> BoostProcessRunner::find_program(std::string_view name) {
    const auto path{bp::search_path(std::string{name})};
    if (path.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path{path.string()};
}

ProcessResult BoostProcessRunner::run(const Command& command) {
    const auto executable{require_program(*this, command.program)};
    PROV_DEBUG_M("Running command", {"cmd", to_string(command), "dir", command.working_dir.string()});

    const auto start_dir{command.working_dir.empty() ? std::filesystem::current_path() : command.working_dir};
    boost::asio::io_context ioc;
    std::future<std::string> out;
    std::future<std::string> err;
    bp::group group;
    bp::child child;
    try {
        child = bp::child{executable.string(), bp::args(command.args), bp::start_dir(start_dir.string()),
                          bp::std_in.close(), bp::std_out > out, bp::std_err > err, group, ioc};
    } catch (const bp::process_error& pe) {
        throw BuildError{BuildErrorKind::kToolchainError, "cannot start " + command.program + ": " + pe.what()};
    }

    if (timeout_) {
        ioc.run_for(*timeout_);
        if (!ioc.stopped()) {
            std::error_code ec;
            group.terminate(ec);
            child.wait(ec);
            throw BuildError{BuildErrorKind::kToolchainError,
                             to_string(command) + " timed out after " + std::to_string(timeout_->count()) + "ms"};
        }
    } else {
        ioc.run();
    }
    child.wait();

    ProcessResult result{child.exit_code(), out.get(), err.get()};
    PROV_DEBUG_M("Command exited", {"cmd", command.program, "code", std::to_string(result.exit_code)});
    PROV_TRACE_M("Command output", {"stdout", tail(result.out, kErrorTailLength), "stderr", tail(result.err, kErrorTailLength)});
    return result;
}

ProcessResult run_checked(ProcessRunner& runner, const Command& command) {
    auto result{runner.run(command)};
    if (!result.succeeded()) {
        const std::string& diagnostic{result.err.empty() ? result.out : result.err};
        throw BuildError{BuildErrorKind::kBuildFailure, to_string(command) + " exited with code " +
                                                            std::to_string(result.exit_code) + ": " +
                                                            tail(diagnostic, kErrorTailLength)};
    }
    return result;
}

std::filesystem::path require_program(ProcessRunner& runner, std::string_view name) {
    auto path{runner.find_program(name)};
    if (!path) {
        throw BuildError{BuildErrorKind::kDependencyMissing, "required tool not found on PATH: " + std::string{name}};
    }
    return *path;
}

std::string to_string(const Command& command) {
    if (command.args.empty()) {
        return command.program;
    }
    return command.program + " " + absl::StrJoin(command.args, " ");
}

std::ostream& operator<<(std::ostream& out, const Command& command) {
    out << to_string(command);
    return out;
}

}  // namespace provenance::build
