// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/formula_error.hpp"

#include <sstream>
#include <utility>

namespace molar::chem
{

    namespace detail
    {
        static std::string describe(formula_errc kind, const std::string &token, std::size_t offset)
        {
            std::ostringstream msg;
            switch (kind)
            {
            case formula_errc::invalid_token:
                msg << "invalid token '" << token << "'";
                break;
            case formula_errc::unknown_symbol:
                msg << "unknown element symbol '" << token << "'";
                break;
            case formula_errc::unbalanced_parentheses:
                msg << "unbalanced parenthesis '" << token << "'";
                break;
            case formula_errc::empty_formula:
                msg << "empty formula";
                break;
            case formula_errc::nesting_too_deep:
                msg << "groups nested too deeply at '" << token << "'";
                break;
            case formula_errc::count_overflow:
                msg << "atom count of '" << token << "' overflows";
                break;
            }
            if (offset != formula_error::npos)
                msg << " at offset " << offset;
            return msg.str();
        }
    }

    const char *to_string(formula_errc kind)
    {
        switch (kind)
        {
        case formula_errc::invalid_token:
            return "invalid_token";
        case formula_errc::unknown_symbol:
            return "unknown_symbol";
        case formula_errc::unbalanced_parentheses:
            return "unbalanced_parentheses";
        case formula_errc::empty_formula:
            return "empty_formula";
        case formula_errc::nesting_too_deep:
            return "nesting_too_deep";
        case formula_errc::count_overflow:
            return "count_overflow";
        }
        return "unknown";
    }

    formula_error::formula_error(formula_errc kind, std::string token_text, std::size_t offset)
        : std::runtime_error(detail::describe(kind, token_text, offset)),
          m_kind(kind),
          m_token(std::move(token_text)),
          m_offset(offset)
    {
    }

} // namespace molar::chem
