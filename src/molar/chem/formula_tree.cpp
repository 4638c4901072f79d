// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molar/chem/formula_tree.hpp"

#include <algorithm>
#include <sstream>

namespace molar::chem
{

    bool operator==(const formula_tree &a, const formula_tree &b)
    {
        return a.nodes == b.nodes;
    }

    bool operator==(const formula_node &a, const formula_node &b)
    {
        return a.multiplier == b.multiplier && a.payload == b.payload;
    }

    namespace detail
    {
        static void render(std::ostringstream &out, const formula_tree &tree)
        {
            for (const auto &node : tree.nodes)
            {
                if (node.is_symbol())
                {
                    out << node.symbol();
                }
                else
                {
                    out << '(';
                    render(out, node.group());
                    out << ')';
                }
                if (node.multiplier != 1)
                    out << node.multiplier;
            }
        }
    }

    std::string to_string(const formula_tree &tree)
    {
        std::ostringstream out;
        detail::render(out, tree);
        return out.str();
    }

    int depth(const formula_tree &tree)
    {
        int deepest = 0;
        for (const auto &node : tree.nodes)
        {
            if (node.is_group())
                deepest = std::max(deepest, 1 + depth(node.group()));
        }
        return deepest;
    }

} // namespace molar::chem
