// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/atomic_mass_table.hpp"
#include "molar/chem/formula_tree.hpp"

#include <cstdint>
#include <string_view>

namespace molar::chem
{

    // Sum of (atomic mass or group mass) * multiplier over the tree, in u.
    // Throws formula_error(unknown_symbol) for the first symbol (depth-first,
    // left to right) missing from the table.
    double molar_mass(const formula_tree &tree, const atomic_mass_table &table = default_atomic_mass_table());

    // Validates, parses and evaluates a formula string.
    double molar_mass(std::string_view formula, const atomic_mass_table &table = default_atomic_mass_table());

    // Number of atoms of `symbol`, group multipliers applied.
    // Throws formula_error(unknown_symbol) when `symbol` is not in the table,
    // even if the count would be zero, or when the tree holds an unknown symbol.
    // Throws formula_error(count_overflow) when the total exceeds std::int64_t.
    std::int64_t count_atoms(const formula_tree &tree, std::string_view symbol, const atomic_mass_table &table = default_atomic_mass_table());
    std::int64_t count_atoms(std::string_view formula, std::string_view symbol, const atomic_mass_table &table = default_atomic_mass_table());

} // namespace molar::chem
