// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/formula_parser.hpp"

#include "molar/chem/formula_error.hpp"

#include <charconv>
#include <cstddef>
#include <system_error>
#include <utility>

namespace molar::chem
{

    namespace
    {
        class parser
        {
        public:
            parser(const std::vector<token> &tokens, const parse_options &options)
                : m_tokens(tokens), m_options(options) {}

            formula_tree parse()
            {
                if (m_tokens.empty())
                    throw formula_error(formula_errc::empty_formula, std::string{});
                return parse_sequence(0);
            }

        private:
            bool at_end() const { return m_pos >= m_tokens.size(); }
            const token &current() const { return m_tokens[m_pos]; }

            // Reads nodes until the end of input or a ')' that closes the group at this depth.
            formula_tree parse_sequence(int depth)
            {
                formula_tree tree;
                while (!at_end())
                {
                    const token &t = current();
                    switch (t.kind)
                    {
                    case token_kind::element:
                    {
                        ++m_pos;
                        std::string symbol = t.text;
                        tree.nodes.push_back(formula_node::symbol_node(std::move(symbol), read_multiplier()));
                        break;
                    }
                    case token_kind::lparen:
                        tree.nodes.push_back(parse_group(depth));
                        break;
                    case token_kind::rparen:
                        if (depth == 0)
                            throw formula_error(formula_errc::unbalanced_parentheses, t.text, t.offset);
                        return tree;
                    case token_kind::number:
                        // multiplier with no symbol or group to attach to
                        throw formula_error(formula_errc::invalid_token, t.text, t.offset);
                    case token_kind::other:
                        throw formula_error(formula_errc::invalid_token, t.text, t.offset);
                    }
                }
                return tree;
            }

            formula_node parse_group(int depth)
            {
                const token &open = current();
                if (depth >= m_options.max_depth)
                    throw formula_error(formula_errc::nesting_too_deep, open.text, open.offset);
                ++m_pos;

                formula_tree inner = parse_sequence(depth + 1);
                if (at_end())
                    throw formula_error(formula_errc::unbalanced_parentheses, open.text, open.offset);

                const token &close = current();
                if (inner.nodes.empty())
                    throw formula_error(formula_errc::invalid_token, close.text, close.offset);
                ++m_pos;

                return formula_node::group_node(std::move(inner), read_multiplier());
            }

            // Optional digit run after a symbol or group; absent means 1.
            int read_multiplier()
            {
                if (at_end() || current().kind != token_kind::number)
                    return 1;

                const token &t = current();
                int value = 0;
                const char *first = t.text.data();
                const char *last = first + t.text.size();
                auto [ptr, ec] = std::from_chars(first, last, value);
                if (ec != std::errc{} || ptr != last || value < 1)
                    throw formula_error(formula_errc::invalid_token, t.text, t.offset);
                ++m_pos;
                return value;
            }

            const std::vector<token> &m_tokens;
            const parse_options &m_options;
            std::size_t m_pos{0};
        };
    }

    formula_tree parse_formula(const std::vector<token> &tokens, const parse_options &options)
    {
        return parser{tokens, options}.parse();
    }

    formula_tree parse_formula(std::string_view formula, const parse_options &options)
    {
        return parse_formula(tokenize(formula), options);
    }

} // namespace molar::chem
