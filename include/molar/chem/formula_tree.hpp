// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace molar::chem
{

    struct formula_node;

    // Nodes in source order. Each group node owns its nested tree.
    struct formula_tree
    {
        std::vector<formula_node> nodes;
    };

    struct formula_node
    {
        std::variant<std::string, formula_tree> payload;
        int multiplier{1};

        static formula_node symbol_node(std::string symbol, int multiplier = 1)
        {
            return formula_node{std::move(symbol), multiplier};
        }
        static formula_node group_node(formula_tree tree, int multiplier = 1)
        {
            return formula_node{std::move(tree), multiplier};
        }

        bool is_symbol() const { return std::holds_alternative<std::string>(payload); }
        bool is_group() const { return std::holds_alternative<formula_tree>(payload); }

        const std::string &symbol() const { return std::get<std::string>(payload); }
        const formula_tree &group() const { return std::get<formula_tree>(payload); }
    };

    bool operator==(const formula_tree &a, const formula_tree &b);
    bool operator==(const formula_node &a, const formula_node &b);

    // Render back to formula text; multipliers of 1 are omitted.
    std::string to_string(const formula_tree &tree);

    // Deepest group nesting; 0 for a tree without groups.
    int depth(const formula_tree &tree);

} // namespace molar::chem
