// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/token.hpp"

namespace molar::chem
{

    namespace detail
    {
        static inline bool is_space(char c)
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }
    }

    std::vector<token> tokenize(std::string_view formula)
    {
        std::vector<token> tokens;
        const std::size_t n = formula.size();
        std::size_t i = 0;
        while (i < n)
        {
            const char c = formula[i];
            if (detail::is_space(c))
            {
                ++i;
                continue;
            }

            const std::size_t start = i;
            token_kind kind = token_kind::other;
            if (is_upper_ascii(c))
            {
                kind = token_kind::element;
                ++i;
                while (i < n && is_lower_ascii(formula[i]))
                    ++i;
            }
            else if (is_digit_ascii(c))
            {
                kind = token_kind::number;
                ++i;
                while (i < n && is_digit_ascii(formula[i]))
                    ++i;
            }
            else if (c == '(')
            {
                kind = token_kind::lparen;
                ++i;
            }
            else if (c == ')')
            {
                kind = token_kind::rparen;
                ++i;
            }
            else
            {
                ++i; // exactly one character
            }

            tokens.push_back(token{kind, std::string(formula.substr(start, i - start)), start});
        }
        return tokens;
    }

} // namespace molar::chem
