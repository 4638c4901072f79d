// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/atomic_mass_table.hpp"

#include <string>
#include <string_view>

namespace molar::chem
{

    // Parse CSV text with a header row naming the "symbol" and "atomic_mass_u"
    // columns; other columns are ignored. source_name is used in error messages.
    // Throws std::runtime_error on a missing column, a malformed row or a duplicate symbol.
    atomic_mass_table parse_atomic_masses_csv(std::string_view csv, const std::string &source_name);

    atomic_mass_table load_atomic_masses_from_csv(const std::string &csv_path);

    // JSON array of objects carrying "Symbol" and "AtomicMass" (number or numeric string).
    atomic_mass_table load_atomic_masses_from_json(const std::string &json_path);

    // ".json" files go to the JSON loader, everything else to the CSV loader.
    atomic_mass_table load_atomic_mass_table(const std::string &path);

} // namespace molar::chem
