// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace molar::chem
{

    enum class formula_errc : std::uint8_t
    {
        invalid_token = 1,      // not part of a symbol, a digit run or a parenthesis
        unknown_symbol,         // element-like token absent from the mass table
        unbalanced_parentheses, // ')' without '(' or '(' never closed
        empty_formula,          // zero tokens
        nesting_too_deep,       // more nested groups than parse_options::max_depth
        count_overflow          // atom count does not fit in std::int64_t
    };

    // Stable lowercase name, e.g. "unknown_symbol".
    const char *to_string(formula_errc kind);

    class formula_error : public std::runtime_error
    {
    public:
        static constexpr std::size_t npos = static_cast<std::size_t>(-1);

        formula_error(formula_errc kind, std::string token_text, std::size_t offset = npos);

        formula_errc kind() const { return m_kind; }
        const std::string &token_text() const { return m_token; }
        // Byte offset of the offending token in the formula, npos if not tied to the input.
        std::size_t offset() const { return m_offset; }

    private:
        formula_errc m_kind;
        std::string m_token;
        std::size_t m_offset;
    };

} // namespace molar::chem
