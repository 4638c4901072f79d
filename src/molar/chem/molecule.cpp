// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/molecule.hpp"

#include "molar/chem/evaluator.hpp"
#include "molar/chem/formula_parser.hpp"
#include "molar/chem/token.hpp"
#include "molar/chem/validator.hpp"

namespace molar::chem
{
    molecule analyze(std::string_view formula, const atomic_mass_table &table)
    {
        const auto tokens = tokenize(formula);
        validate(tokens, table);
        const formula_tree tree = parse_formula(tokens);

        molecule out{};
        out.formula = std::string(formula);
        out.mass_u = molar_mass(tree, table);

        out.composition = composition(tokens, tree, table);
        return out;
    }
}
