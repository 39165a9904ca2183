// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "source_checkout.hpp"

#include <provenance/infra/common/log.hpp>

namespace provenance::build {

void checkout_source(ProcessRunner& runner, const SourceRevision& source, const std::filesystem::path& dir) {
    require_program(runner, "git");

    PROV_INFO_M("Cloning source", {"repository", source.repository_url});
    run_checked(runner, Command{
                            .program = "git",
                            .args = {"clone", "--quiet", "--", source.repository_url, dir.string()},
                            .working_dir = dir.parent_path(),
                        });

    if (source.revision) {
        PROV_INFO_M("Checking out revision", {"revision", *source.revision});
        run_checked(runner, Command{
                                .program = "git",
                                .args = {"checkout", "--quiet", "--detach", *source.revision},
                                .working_dir = dir,
                            });
    }
}

}  // namespace provenance::build
