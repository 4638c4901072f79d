// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/validator.hpp"

#include "molar/chem/formula_error.hpp"

namespace molar::chem
{

    bool is_accepted(const token &t, const atomic_mass_table &table)
    {
        switch (t.kind)
        {
        case token_kind::lparen:
        case token_kind::rparen:
        case token_kind::number:
            return true;
        case token_kind::element:
            return table.contains(t.text);
        case token_kind::other:
            return false;
        }
        return false;
    }

    void validate(const std::vector<token> &tokens, const atomic_mass_table &table)
    {
        if (tokens.empty())
            throw formula_error(formula_errc::empty_formula, std::string{});

        for (const auto &t : tokens)
        {
            if (is_accepted(t, table))
                continue;
            if (t.kind == token_kind::element)
                throw formula_error(formula_errc::unknown_symbol, t.text, t.offset);
            throw formula_error(formula_errc::invalid_token, t.text, t.offset);
        }
    }

    void validate(std::string_view formula, const atomic_mass_table &table)
    {
        validate(tokenize(formula), table);
    }

    std::string clean_copy(std::string_view formula, const atomic_mass_table &table)
    {
        std::string out;
        out.reserve(formula.size());
        for (const auto &t : tokenize(formula))
        {
            if (is_accepted(t, table))
                out += t.text;
        }
        return out;
    }

} // namespace molar::chem
