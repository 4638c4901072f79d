// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/atomic_mass_table.hpp"

#include "molar/chem/element_data.hpp"
#include "molar/chem/formula_error.hpp"
#include "molar/chem/mass_table_loader.hpp"

namespace molar::chem
{

    double atomic_mass_table::mass_of(std::string_view symbol) const
    {
        auto it = m_masses.find(symbol);
        if (it == m_masses.end())
            throw formula_error(formula_errc::unknown_symbol, std::string(symbol));
        return it->second;
    }

    const atomic_mass_table &default_atomic_mass_table()
    {
        static const atomic_mass_table table = parse_atomic_masses_csv(data::kAtomicMassesCSV, "<built-in>");
        return table;
    }

} // namespace molar::chem
