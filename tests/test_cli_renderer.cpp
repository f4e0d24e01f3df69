/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "test_common.h"
#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/config.hpp"

#include <string>
#include <vector>

namespace {

SystemSnapshot sample_snapshot() {
    SystemSnapshot s;
    s.os = "Test OS 1.0";
    s.kernel = "6.1.0";
    s.arch = "x86_64";
    s.host = "devbox";
    s.user = "alice";
    s.shell = "/bin/bash";
    s.term = "xterm";
    s.cpu = "Test CPU";
    s.uptime = "1h 1m";
    s.memory = {7812, 5859};
    s.disk = {100, 60};
    return s;
}

std::string strip_escapes(const std::string& s) {
    std::string out;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\033') {
            while (i < s.size() && s[i] != 'm') ++i;
            continue;
        }
        out += s[i];
    }
    return out;
}

}  // namespace

int main() {
    using namespace CliRenderer;

    // Percentages
    {
        expect_near(percent(5859, 7812), 75.0, 0.05, "memory percent");
        expect_near(percent(60, 100), 60.0, 1e-9, "disk percent");
        expect_near(percent(0, 0), 0.0, 1e-9, "zero total");
        expect_near(percent(5, 0), 0.0, 1e-9, "zero total with used");
    }

    // Info lines carry the snapshot, plain text first
    {
        auto info = info_lines(sample_snapshot(), "2024-01-02 03:04:05");
        expect_eq_ll(static_cast<long long>(info.size()), 15, "info line count");
        expect_eq_str(to_plain(info[0]), "alice@devbox", "user@host");
        expect_true(to_plain(info[1]).starts_with("cafetch v"), "banner");
        expect_eq_str(to_plain(info[2]), "", "separator after banner");
        expect_eq_str(to_plain(info[3]), "OS:     Test OS 1.0", "os line");
        expect_eq_str(to_plain(info[4]), "Kernel: 6.1.0", "kernel line");
        expect_eq_str(to_plain(info[5]), "Arch:   x86_64", "arch line");
        expect_eq_str(to_plain(info[6]), "Uptime: 1h 1m", "uptime line");
        expect_eq_str(to_plain(info[7]), "", "separator before hardware");
        expect_eq_str(to_plain(info[8]), "CPU:  Test CPU", "cpu line");
        expect_eq_str(to_plain(info[9]), "Mem:  5859MB / 7812MB (75.0%)", "memory line");
        expect_eq_str(to_plain(info[10]), "Disk: 60GB / 100GB (60.0%)", "disk line");
        expect_eq_str(to_plain(info[11]), "", "separator before session");
        expect_eq_str(to_plain(info[12]), "Shell: /bin/bash", "shell line");
        expect_eq_str(to_plain(info[13]), "Term:  xterm", "term line");
        expect_eq_str(to_plain(info[14]), "Time:  2024-01-02 03:04:05", "time line");
    }

    // Unmeasured usage prints zero percent
    {
        SystemSnapshot s = sample_snapshot();
        s.memory = {};
        s.disk = {};
        auto info = info_lines(s, "t");
        expect_eq_str(to_plain(info[9]), "Mem:  0MB / 0MB (0.0%)", "unmeasured memory");
        expect_eq_str(to_plain(info[10]), "Disk: 0GB / 0GB (0.0%)", "unmeasured disk");
    }

    // Styles only turn into escapes in to_ansi
    {
        StyledLine line{{Style::Yellow, "OS: "}, {Style::Plain, "Test"}};
        std::string expected = std::string(Color::YELLOW) + "OS: " + std::string(Color::RESET) + "Test";
        expect_eq_str(to_ansi(line), expected, "ansi rendering");
        expect_eq_str(to_plain(line), "OS: Test", "plain rendering");
        expect_eq_ll(static_cast<long long>(visible_width(line)), 8, "visible width");
        expect_eq_str(to_ansi({}), "", "empty line");
    }

    // The graphic never changes
    {
        auto graphic = graphic_lines();
        expect_eq_ll(static_cast<long long>(graphic.size()), 6, "graphic line count");
        expect_eq_str(to_plain(graphic[0]), "     ( (  ", "steam");
        expect_eq_str(to_plain(graphic[5]), "   ======  ", "saucer");
        for (const auto& line : graphic) {
            expect_true(visible_width(line) <= Config::GRAPHIC_COLUMN_WIDTH, "graphic fits column");
        }
    }

    // Composition: max(graphic, info) lines, graphic column padded
    {
        auto graphic = graphic_lines();
        auto info = info_lines(sample_snapshot(), "2024-01-02 03:04:05");
        auto lines = compose(graphic, info);
        expect_eq_ll(static_cast<long long>(lines.size()), 15, "composed line count");

        std::string first = strip_escapes(lines[0]);
        expect_eq_str(first, "       ( (" + std::string(14, ' ') + "alice@devbox", "first composed line");

        std::string last = strip_escapes(lines[14]);
        expect_eq_str(last, std::string(24, ' ') + "Time:  2024-01-02 03:04:05", "graphic exhausted");
    }

    // Longer graphic than info
    {
        std::vector<StyledLine> graphic(4, StyledLine{{Style::Cyan, "##"}});
        std::vector<StyledLine> info{{{Style::Plain, "only"}}};
        auto lines = compose(graphic, info);
        expect_eq_ll(static_cast<long long>(lines.size()), 4, "graphic-driven line count");
        expect_eq_str(strip_escapes(lines[0]), "  ##" + std::string(18, ' ') + "  only", "paired line");
        expect_eq_str(strip_escapes(lines[3]), "  ##" + std::string(18, ' ') + "  ", "info exhausted");
    }

    // Both empty
    {
        expect_true(compose({}, {}).empty(), "nothing to compose");
    }

    // Timestamp shape
    {
        auto ts = format_timestamp(1700000000);
        expect_eq_ll(static_cast<long long>(ts.size()), 19, "timestamp width");
        expect_true(ts[4] == '-' && ts[7] == '-' && ts[10] == ' ' && ts[13] == ':' && ts[16] == ':',
                    "timestamp layout");
    }

    std::cout << "test_cli_renderer: ALL PASSED" << std::endl;
    return 0;
}
