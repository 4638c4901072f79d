// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace molar::chem
{

    // Immutable mapping from element symbol (case-sensitive) to atomic mass in u.
    class atomic_mass_table
    {
    public:
        using map_type = std::map<std::string, double, std::less<>>;

        atomic_mass_table() = default;
        explicit atomic_mass_table(map_type masses)
            : m_masses(std::move(masses)) {}

        std::size_t size() const { return m_masses.size(); }
        bool empty() const { return m_masses.empty(); }

        bool contains(std::string_view symbol) const { return m_masses.find(symbol) != m_masses.end(); }

        std::optional<double> find(std::string_view symbol) const
        {
            auto it = m_masses.find(symbol);
            if (it == m_masses.end())
                return std::nullopt;
            return it->second;
        }

        // Throws formula_error(unknown_symbol) for a symbol outside the table.
        double mass_of(std::string_view symbol) const;

        // Sorted by symbol
        const map_type &all() const { return m_masses; }

    private:
        map_type m_masses;
    };

    // Process-wide built-in table (H through Mt), built on first use.
    const atomic_mass_table &default_atomic_mass_table();

} // namespace molar::chem
