// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/atomic_mass_table.hpp"
#include "molar/chem/token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace molar::chem
{

    // A token is accepted if it is a parenthesis, a digit run, or an element in the table.
    bool is_accepted(const token &t, const atomic_mass_table &table);

    // Throws formula_error for the leftmost rejected token:
    // unknown_symbol for an element token outside the table, invalid_token for
    // anything else, empty_formula when there are no tokens at all.
    void validate(const std::vector<token> &tokens, const atomic_mass_table &table = default_atomic_mass_table());
    void validate(std::string_view formula, const atomic_mass_table &table = default_atomic_mass_table());

    // Drop every token is_accepted() rejects and join the rest. Never throws.
    // Parentheses are not rebalanced, so the result may still fail to parse.
    std::string clean_copy(std::string_view formula, const atomic_mass_table &table = default_atomic_mass_table());

} // namespace molar::chem
