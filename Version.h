// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_VERSION_H
#define TAGDECK_VERSION_H

#include <string_view>

namespace Version {
    inline constexpr std::string_view VERSION = "0.2.0";

    // Bumped whenever a CatalogService slot or signal changes shape.
    inline constexpr unsigned API_VERSION = 1;
};

#endif //TAGDECK_VERSION_H
