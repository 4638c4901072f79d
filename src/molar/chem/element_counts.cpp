// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/element_counts.hpp"

#include "molar/chem/evaluator.hpp"
#include "molar/chem/formula_parser.hpp"
#include "molar/chem/formula_tree.hpp"
#include "molar/chem/token.hpp"
#include "molar/chem/validator.hpp"

#include <set>
#include <utility>

namespace molar::chem
{

    namespace detail
    {
        static element_count count_entry(const formula_tree &tree, const std::string &symbol, const atomic_mass_table &table)
        {
            return element_count{symbol, count_atoms(tree, symbol, table)};
        }
    }

    // State of one enumeration; never shared between begin() calls.
    struct element_counts::iterator::pass
    {
        std::vector<std::string> symbols; // distinct, ascending
        formula_tree tree;
        const atomic_mass_table *table{nullptr};
    };

    element_counts::iterator::iterator(std::shared_ptr<const pass> state)
        : m_state(std::move(state))
    {
        load();
    }

    bool element_counts::iterator::at_end() const
    {
        return !m_state || m_index >= m_state->symbols.size();
    }

    void element_counts::iterator::load()
    {
        if (at_end())
            return;
        m_current = detail::count_entry(m_state->tree, m_state->symbols[m_index], *m_state->table);
    }

    element_counts::iterator &element_counts::iterator::operator++()
    {
        ++m_index;
        load();
        return *this;
    }

    bool operator==(const element_counts::iterator &a, const element_counts::iterator &b)
    {
        const bool a_end = a.at_end();
        const bool b_end = b.at_end();
        if (a_end || b_end)
            return a_end == b_end;
        return a.m_state == b.m_state && a.m_index == b.m_index;
    }

    element_counts::iterator element_counts::begin() const
    {
        const auto tokens = tokenize(m_formula);
        validate(tokens, *m_table);

        auto state = std::make_shared<iterator::pass>();
        state->symbols = distinct_symbols(tokens);
        state->tree = parse_formula(tokens);
        state->table = m_table;
        return iterator{std::move(state)};
    }

    std::vector<element_count> composition(std::string_view formula, const atomic_mass_table &table)
    {
        element_counts counts{std::string(formula), table};
        return std::vector<element_count>(counts.begin(), counts.end());
    }

    std::vector<std::string> distinct_symbols(const std::vector<token> &tokens)
    {
        std::set<std::string> distinct;
        for (const auto &t : tokens)
        {
            if (t.kind == token_kind::element)
                distinct.insert(t.text);
        }
        return std::vector<std::string>(distinct.begin(), distinct.end());
    }

    std::vector<element_count> composition(const std::vector<token> &tokens, const formula_tree &tree, const atomic_mass_table &table)
    {
        std::vector<element_count> out;
        for (const auto &symbol : distinct_symbols(tokens))
            out.push_back(detail::count_entry(tree, symbol, table));
        return out;
    }

} // namespace molar::chem
