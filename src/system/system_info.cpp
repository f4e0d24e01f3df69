/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/system_info.hpp"

SystemSnapshot SystemInfo::collect(const Host& host) {
    SystemSnapshot snapshot;
    snapshot.os = resolve_os(host);
    snapshot.kernel = resolve_kernel(host);
    snapshot.arch = resolve_arch(host);

    snapshot.host = resolve_hostname(host);
    snapshot.user = resolve_user(host);
    snapshot.shell = resolve_shell(host);
    snapshot.term = resolve_term(host);

    snapshot.cpu = resolve_cpu_model(host);
    snapshot.uptime = resolve_uptime(host);
    snapshot.memory = resolve_memory(host);
    snapshot.disk = resolve_disk(host);
    return snapshot;
}
