/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "test_common.h"
#include "fake_host.h"
#include "include/application.hpp"

#include <string>
#include <vector>

namespace {

int run_with(const Host& host, std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    Application app(host);
    return app.run(static_cast<int>(args.size()), argv.data());
}

}  // namespace

int main() {
    FakeHost host = make_populated_host();

    expect_eq_ll(run_with(host, {"cafetch"}), 0, "report run");
    expect_true(host.commands_run.size() == 1, "report collects kernel once");

    host.commands_run.clear();
    expect_eq_ll(run_with(host, {"cafetch", "--help"}), 0, "--help");
    expect_eq_ll(run_with(host, {"cafetch", "-h"}), 0, "-h");
    expect_eq_ll(run_with(host, {"cafetch", "--version"}), 0, "--version");
    expect_eq_ll(run_with(host, {"cafetch", "-v"}), 0, "-v");
    expect_true(host.commands_run.empty(), "informational flags skip collection");

    expect_eq_ll(run_with(host, {"cafetch", "--json"}), 1, "unknown option");

    FakeHost empty;
    expect_eq_ll(run_with(empty, {"/usr/local/bin/cafetch"}), 0, "report with every source missing");

    std::cout << "test_application: ALL PASSED" << std::endl;
    return 0;
}
