// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace molar::chem
{

    enum class token_kind : std::uint8_t
    {
        element, // [A-Z][a-z]*
        number,  // [0-9]+
        lparen,
        rparen,
        other // any other single non-whitespace character
    };

    struct token
    {
        token_kind kind{token_kind::other};
        std::string text;       // exact source text
        std::size_t offset{0};  // byte offset in the formula

        friend bool operator==(const token &, const token &) = default;
    };

    inline bool is_upper_ascii(char c) { return c >= 'A' && c <= 'Z'; }
    inline bool is_lower_ascii(char c) { return c >= 'a' && c <= 'z'; }
    inline bool is_digit_ascii(char c) { return c >= '0' && c <= '9'; }

    // True if s has the shape of an element symbol: one uppercase letter then lowercase letters.
    inline bool is_symbol_text(std::string_view s)
    {
        if (s.empty() || !is_upper_ascii(s.front()))
            return false;
        for (std::size_t i = 1; i < s.size(); ++i)
        {
            if (!is_lower_ascii(s[i]))
                return false;
        }
        return true;
    }

    // Scan a formula left to right into tokens. Never fails; unrecognized
    // characters come back as token_kind::other and whitespace is skipped.
    std::vector<token> tokenize(std::string_view formula);

} // namespace molar::chem
