// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/evaluator.hpp"

#include "molar/chem/formula_error.hpp"
#include "molar/chem/formula_parser.hpp"
#include "molar/chem/validator.hpp"

#include <limits>
#include <string>

namespace molar::chem
{

    namespace detail
    {
        constexpr std::int64_t kMaxCount = std::numeric_limits<std::int64_t>::max();

        // Operands are non-negative: counts start at 0 and multipliers are >= 1.
        static std::int64_t checked_add(std::int64_t a, std::int64_t b, std::string_view symbol)
        {
            if (a > kMaxCount - b)
                throw formula_error(formula_errc::count_overflow, std::string(symbol));
            return a + b;
        }

        static std::int64_t checked_mul(std::int64_t a, std::int64_t b, std::string_view symbol)
        {
            if (b != 0 && a > kMaxCount / b)
                throw formula_error(formula_errc::count_overflow, std::string(symbol));
            return a * b;
        }

        static std::int64_t tree_count(const formula_tree &tree, std::string_view symbol, const atomic_mass_table &table)
        {
            std::int64_t total = 0;
            for (const auto &node : tree.nodes)
            {
                if (node.is_symbol())
                {
                    if (!table.contains(node.symbol()))
                        throw formula_error(formula_errc::unknown_symbol, node.symbol());
                    if (node.symbol() == symbol)
                        total = checked_add(total, node.multiplier, symbol);
                }
                else
                {
                    const std::int64_t inner = tree_count(node.group(), symbol, table);
                    total = checked_add(total, checked_mul(inner, node.multiplier, symbol), symbol);
                }
            }
            return total;
        }
    }

    double molar_mass(const formula_tree &tree, const atomic_mass_table &table)
    {
        double total = 0.0;
        for (const auto &node : tree.nodes)
        {
            const double unit = node.is_symbol() ? table.mass_of(node.symbol()) : molar_mass(node.group(), table);
            total += unit * node.multiplier;
        }
        return total;
    }

    double molar_mass(std::string_view formula, const atomic_mass_table &table)
    {
        const auto tokens = tokenize(formula);
        validate(tokens, table);
        return molar_mass(parse_formula(tokens), table);
    }

    std::int64_t count_atoms(const formula_tree &tree, std::string_view symbol, const atomic_mass_table &table)
    {
        if (!table.contains(symbol))
            throw formula_error(formula_errc::unknown_symbol, std::string(symbol));
        return detail::tree_count(tree, symbol, table);
    }

    std::int64_t count_atoms(std::string_view formula, std::string_view symbol, const atomic_mass_table &table)
    {
        if (!table.contains(symbol))
            throw formula_error(formula_errc::unknown_symbol, std::string(symbol));
        const auto tokens = tokenize(formula);
        validate(tokens, table);
        return detail::tree_count(parse_formula(tokens), symbol, table);
    }

} // namespace molar::chem
