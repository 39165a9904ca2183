// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dependency_installer.hpp"

#include <provenance/build/build_error.hpp>
#include <provenance/infra/common/log.hpp>

namespace provenance::build {

static void install_node_packages(ProcessRunner& runner, const ProjectLayout& layout) {
    std::string manager;
    if (runner.find_program("yarn")) {
        manager = "yarn";
    } else if (runner.find_program("npm")) {
        manager = "npm";
    } else {
        throw BuildError{BuildErrorKind::kDependencyMissing, "package.json found but neither yarn nor npm is installed"};
    }
    PROV_INFO_M("Installing node packages", {"manager", manager});
    run_checked(runner, Command{.program = manager, .args = {"install"}, .working_dir = layout.root});
}

void install_dependencies(ProcessRunner& runner, const ProjectLayout& layout) {
    if (layout.has_package_json) {
        install_node_packages(runner, layout);
    }
    if (layout.has_foundry_config) {
        require_program(runner, "forge");
        PROV_INFO << "Installing Foundry libraries";
        run_checked(runner, Command{.program = "forge", .args = {"install"}, .working_dir = layout.root});
    }
}

}  // namespace provenance::build
