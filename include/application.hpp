/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>

#include "host.hpp"

class Application {
   public:
    explicit Application(const Host& host) : host_(host) {}

    int run(int argc, char* argv[]);

   private:
    const Host& host_;

    void show_help(const std::string& app_name) const;
    void show_version() const;
};
