// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef IVL_HPP
#define IVL_HPP

// Umbrella header for the ivl library.  Including this single header pulls in
// every public component: property lists, the container contract, interval
// trees, and the text containers that own them.

#include "ivl/config.hpp"
#include "ivl/error.hpp"
#include "ivl/property_list.hpp"
#include "ivl/container.hpp"
#include "ivl/interval.hpp"
#include "ivl/text.hpp"

namespace ivl {
    constexpr int MAJOR_VERSION = 1;
    constexpr int MINOR_VERSION = 0;
    constexpr int PATCH_VERSION = 0;

    // Returns the library version as a human-readable string.
    inline const char* version() noexcept {
        return "1.0.0";
    }
}

#endif  // IVL_HPP
