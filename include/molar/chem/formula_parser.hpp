// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molar/chem/formula_tree.hpp"
#include "molar/chem/token.hpp"

#include <string_view>
#include <vector>

namespace molar::chem
{

    struct parse_options
    {
        // Maximum number of nested groups, e.g. "((H))" needs 2.
        int max_depth{256};
    };

    // Structural parse of a formula into a tree. Symbols are not checked
    // against any mass table, so "Xx2" parses fine.
    //
    // Throws formula_error on the leftmost problem:
    //   empty_formula          - no tokens
    //   invalid_token          - stray character, a multiplier with nothing before it,
    //                            a multiplier of 0 or too large for int, an empty group "()"
    //   unbalanced_parentheses - ')' without '(' or '(' never closed
    //   nesting_too_deep       - more than options.max_depth nested groups
    formula_tree parse_formula(const std::vector<token> &tokens, const parse_options &options = {});
    formula_tree parse_formula(std::string_view formula, const parse_options &options = {});

} // namespace molar::chem
