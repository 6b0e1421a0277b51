// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_VERSION_H
#define FINDEX_VERSION_H

#include <string_view>

namespace Version {
    inline constexpr std::string_view VERSION = "0.4.0";

    // Bumped whenever the D-Bus interface of findexd changes shape.
    inline constexpr unsigned int API_VERSION = 1;
};

#endif //FINDEX_VERSION_H
