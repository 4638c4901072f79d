// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/atomic_mass_table.hpp"
#include "molar/chem/formula_tree.hpp"
#include "molar/chem/token.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace molar::chem
{

    struct element_count
    {
        std::string symbol;
        std::int64_t count{0};

        friend bool operator==(const element_count &, const element_count &) = default;
    };

    // Distinct elements of a formula with their total atom counts, sorted by symbol.
    //
    // Every begin() starts over: it tokenizes and validates the formula, collects
    // the distinct element tokens and parses a fresh tree. Counts are computed as
    // the iterator reaches each element. begin() throws formula_error for an
    // invalid formula.
    class element_counts
    {
    public:
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = element_count;
            using difference_type = std::ptrdiff_t;
            using pointer = const element_count *;
            using reference = const element_count &;

            iterator() = default;

            reference operator*() const { return m_current; }
            pointer operator->() const { return &m_current; }

            iterator &operator++();
            iterator operator++(int)
            {
                iterator prev = *this;
                ++*this;
                return prev;
            }

            friend bool operator==(const iterator &a, const iterator &b);

        private:
            friend class element_counts;
            struct pass;

            explicit iterator(std::shared_ptr<const pass> state);
            bool at_end() const;
            void load();

            std::shared_ptr<const pass> m_state;
            std::size_t m_index{0};
            element_count m_current;
        };

        explicit element_counts(std::string formula, const atomic_mass_table &table = default_atomic_mass_table())
            : m_formula(std::move(formula)), m_table(&table) {}
        // The table is referenced, not copied, so it must outlive the range.
        element_counts(std::string formula, const atomic_mass_table &&table) = delete;

        iterator begin() const;
        iterator end() const { return iterator{}; }

        const std::string &formula() const { return m_formula; }

    private:
        std::string m_formula;
        const atomic_mass_table *m_table;
    };

    // Fully evaluated element_counts.
    std::vector<element_count> composition(std::string_view formula, const atomic_mass_table &table = default_atomic_mass_table());

    // Distinct element symbols among the tokens, ascending.
    std::vector<std::string> distinct_symbols(const std::vector<token> &tokens);

    // Counts for already validated tokens and the tree parsed from them.
    std::vector<element_count> composition(const std::vector<token> &tokens, const formula_tree &tree, const atomic_mass_table &table);

} // namespace molar::chem
