/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <print>
#include <string>

#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/config.hpp"
#include "include/results.hpp"
#include "include/system_info.hpp"

namespace fs = std::filesystem;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [option]", app_name);
    std::println("");
    std::println("Prints a snapshot of this machine's OS, kernel, CPU, memory, disk and session.");
    std::println("");
    std::println("Options:");
    std::println("  {:<{}}Show this help message", "-h, --help", Config::HELP_OPTION_WIDTH);
    std::println("  {:<{}}Show version information", "-v, --version", Config::HELP_OPTION_WIDTH);
}

void Application::show_version() const {
    std::println("{} v{} ({})", Config::APP_NAME, Config::APP_VERSION, Config::BUILD_COMPILER);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

int Application::run(int argc, char* argv[]) {
    try {
        std::string app_name{Config::APP_NAME};
        if (argc > 0 && argv[0] != nullptr) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                show_help(app_name);
                return 0;
            } else if (arg == "-v" || arg == "--version") {
                show_version();
                return 0;
            } else {
                std::println(
                    stderr, "{}Error: Unknown option '{}'{}", Color::RED, arg, Color::RESET);
                show_help(app_name);
                return 1;
            }
        }

        const SystemSnapshot snapshot = SystemInfo::collect(host_);

        auto now = std::chrono::system_clock::now();
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
        CliRenderer::render_report(snapshot, CliRenderer::format_timestamp(epoch.count()));

    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        return 1;
    }

    return 0;
}
