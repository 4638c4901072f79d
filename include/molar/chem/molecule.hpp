// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/atomic_mass_table.hpp"
#include "molar/chem/element_counts.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace molar::chem
{
    // Everything derived from one formula string.
    struct molecule
    {
        std::string formula;                     // e.g., Ca(NO3)2
        double mass_u{0.0};                      // molecular mass, unrounded
        std::vector<element_count> composition;  // sorted by symbol
    };

    // Validate once, parse once, then evaluate mass and composition.
    // Throws formula_error like molar_mass().
    molecule analyze(std::string_view formula, const atomic_mass_table &table = default_atomic_mass_table());
}
