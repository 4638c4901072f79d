// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include "molar/chem/formula_error.hpp"
#include "molar/chem/formula_parser.hpp"

#include <string>

using namespace molar::chem;

namespace {

formula_error parse_failure(const std::string &formula, const parse_options &options = {}) {
    try {
        parse_formula(formula, options);
    } catch (const formula_error &e) {
        return e;
    }
    ADD_FAILURE() << "parse_formula(\"" << formula << "\") did not throw";
    return formula_error(formula_errc::invalid_token, "");
}

}

TEST(FormulaParserTest, BuildsNestedTree) {
    formula_tree nitrate;
    nitrate.nodes.push_back(formula_node::symbol_node("N"));
    nitrate.nodes.push_back(formula_node::symbol_node("O", 3));

    formula_tree expected;
    expected.nodes.push_back(formula_node::symbol_node("Ca"));
    expected.nodes.push_back(formula_node::group_node(nitrate, 2));

    const formula_tree tree = parse_formula("Ca(NO3)2");
    EXPECT_TRUE(tree == expected);

    ASSERT_EQ(tree.nodes.size(), 2u);
    EXPECT_TRUE(tree.nodes[0].is_symbol());
    EXPECT_EQ(tree.nodes[0].multiplier, 1);
    EXPECT_TRUE(tree.nodes[1].is_group());
    EXPECT_EQ(tree.nodes[1].multiplier, 2);
    EXPECT_EQ(tree.nodes[1].group().nodes[1].symbol(), "O");
}

TEST(FormulaParserTest, PreservesSourceOrder) {
    const formula_tree tree = parse_formula("OHC");
    ASSERT_EQ(tree.nodes.size(), 3u);
    EXPECT_EQ(tree.nodes[0].symbol(), "O");
    EXPECT_EQ(tree.nodes[1].symbol(), "H");
    EXPECT_EQ(tree.nodes[2].symbol(), "C");
}

TEST(FormulaParserTest, RendersBack) {
    EXPECT_EQ(to_string(parse_formula("Be3Al2(SiO3)6")), "Be3Al2(SiO3)6");
    EXPECT_EQ(to_string(parse_formula("K4(Fe(CN)6)")), "K4(Fe(CN)6)");
    EXPECT_EQ(to_string(parse_formula("H1")), "H");
    EXPECT_EQ(to_string(parse_formula("Ca (NO3)2")), "Ca(NO3)2");
}

TEST(FormulaParserTest, DeepNesting) {
    EXPECT_EQ(depth(parse_formula("H2O")), 0);
    EXPECT_EQ(depth(parse_formula("K4(Fe(CN)6)")), 2);
    EXPECT_EQ(depth(parse_formula("(H)((O))")), 2);
}

TEST(FormulaParserTest, UnknownSymbolsStillParse) {
    const formula_tree tree = parse_formula("Xx2");
    ASSERT_EQ(tree.nodes.size(), 1u);
    EXPECT_EQ(tree.nodes[0].symbol(), "Xx");
    EXPECT_EQ(tree.nodes[0].multiplier, 2);
}

TEST(FormulaParserTest, LeadingZeroMultiplier) {
    EXPECT_EQ(parse_formula("H02").nodes[0].multiplier, 2);
}

TEST(FormulaParserTest, EmptyFormula) {
    EXPECT_EQ(parse_failure("").kind(), formula_errc::empty_formula);
    EXPECT_EQ(parse_failure(" ").kind(), formula_errc::empty_formula);
}

TEST(FormulaParserTest, BareMultiplierIsInvalidToken) {
    auto e = parse_failure("2H");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.offset(), 0u);

    e = parse_failure("(2H)");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.offset(), 1u);

    e = parse_failure("H2 3");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.token_text(), "3");
    EXPECT_EQ(e.offset(), 3u);
}

TEST(FormulaParserTest, MultiplierMustBePositiveAndFit) {
    auto e = parse_failure("H0");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.token_text(), "0");

    e = parse_failure("H99999999999999999999");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.offset(), 1u);
}

TEST(FormulaParserTest, EmptyGroupIsInvalidToken) {
    const auto e = parse_failure("H()2");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.token_text(), ")");
    EXPECT_EQ(e.offset(), 2u);
}

TEST(FormulaParserTest, StrayCharacterIsInvalidToken) {
    const auto e = parse_failure("H$");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.offset(), 1u);
}

TEST(FormulaParserTest, UnbalancedParentheses) {
    auto e = parse_failure("(H");
    EXPECT_EQ(e.kind(), formula_errc::unbalanced_parentheses);
    EXPECT_EQ(e.token_text(), "(");
    EXPECT_EQ(e.offset(), 0u);

    e = parse_failure("H)");
    EXPECT_EQ(e.kind(), formula_errc::unbalanced_parentheses);
    EXPECT_EQ(e.token_text(), ")");
    EXPECT_EQ(e.offset(), 1u);

    // Inner group closes, outer one does not
    e = parse_failure("((H)");
    EXPECT_EQ(e.kind(), formula_errc::unbalanced_parentheses);
    EXPECT_EQ(e.offset(), 0u);

    e = parse_failure("(H))2");
    EXPECT_EQ(e.kind(), formula_errc::unbalanced_parentheses);
    EXPECT_EQ(e.offset(), 3u);
}

TEST(FormulaParserTest, NestingLimit) {
    parse_options options;
    options.max_depth = 3;
    EXPECT_NO_THROW(parse_formula("(((H)))", options));

    const auto e = parse_failure("((((H))))", options);
    EXPECT_EQ(e.kind(), formula_errc::nesting_too_deep);
    EXPECT_EQ(e.offset(), 3u);
}

TEST(FormulaParserTest, DefaultNestingLimitRejectsPathologicalInput) {
    const std::string formula = std::string(10000, '(') + "H" + std::string(10000, ')');
    EXPECT_EQ(parse_failure(formula).kind(), formula_errc::nesting_too_deep);

    const std::string ok = std::string(200, '(') + "H" + std::string(200, ')');
    EXPECT_EQ(depth(parse_formula(ok)), 200);
}

TEST(FormulaParserTest, ParsesFromTokens) {
    EXPECT_TRUE(parse_formula(tokenize("NaCl")) == parse_formula("NaCl"));
}
