// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include "molar/chem/formula_error.hpp"
#include "molar/chem/validator.hpp"

#include <string>
#include <vector>

using namespace molar::chem;

namespace {

formula_error capture(const std::string &formula) {
    try {
        validate(formula);
    } catch (const formula_error &e) {
        return e;
    }
    ADD_FAILURE() << "validate(\"" << formula << "\") did not throw";
    return formula_error(formula_errc::invalid_token, "");
}

}

TEST(ValidatorTest, AcceptsKnownSymbolsDigitsAndParentheses) {
    EXPECT_NO_THROW(validate("H2O"));
    EXPECT_NO_THROW(validate("Ca(NO3)2"));
    EXPECT_NO_THROW(validate("Be3Al2(SiO3)6"));
}

TEST(ValidatorTest, UnknownSymbolIsDistinctFromInvalidToken) {
    const auto unknown = capture("Xx");
    EXPECT_EQ(unknown.kind(), formula_errc::unknown_symbol);
    EXPECT_EQ(unknown.token_text(), "Xx");
    EXPECT_EQ(unknown.offset(), 0u);

    const auto invalid = capture("H2$O");
    EXPECT_EQ(invalid.kind(), formula_errc::invalid_token);
    EXPECT_EQ(invalid.token_text(), "$");
    EXPECT_EQ(invalid.offset(), 2u);

    EXPECT_NE(unknown.kind(), invalid.kind());
}

TEST(ValidatorTest, LeftmostRejectedTokenWins) {
    EXPECT_EQ(capture("Xx$").kind(), formula_errc::unknown_symbol);
    EXPECT_EQ(capture("$Xx").kind(), formula_errc::invalid_token);
    EXPECT_EQ(capture("H2OQq").offset(), 3u);
}

TEST(ValidatorTest, LowercaseFormulaIsInvalidToken) {
    const auto e = capture("h2o");
    EXPECT_EQ(e.kind(), formula_errc::invalid_token);
    EXPECT_EQ(e.token_text(), "h");
}

TEST(ValidatorTest, EmptyFormula) {
    EXPECT_EQ(capture("").kind(), formula_errc::empty_formula);
    EXPECT_EQ(capture("   ").kind(), formula_errc::empty_formula);
}

TEST(ValidatorTest, DoesNotCheckStructure) {
    // Balance is the parser's job
    EXPECT_NO_THROW(validate("(H"));
    EXPECT_NO_THROW(validate("2H"));
}

TEST(ValidatorTest, UsesTheGivenTable) {
    const atomic_mass_table table{atomic_mass_table::map_type{{"H", 1.0}, {"O", 16.0}}};
    EXPECT_NO_THROW(validate("H2O", table));
    try {
        validate("NaCl", table);
        FAIL() << "Na is not in the custom table";
    } catch (const formula_error &e) {
        EXPECT_EQ(e.kind(), formula_errc::unknown_symbol);
        EXPECT_EQ(e.token_text(), "Na");
    }
}

TEST(ValidatorTest, IsAcceptedPerTokenKind) {
    const auto &table = default_atomic_mass_table();
    EXPECT_TRUE(is_accepted(token{token_kind::lparen, "(", 0}, table));
    EXPECT_TRUE(is_accepted(token{token_kind::number, "12", 0}, table));
    EXPECT_TRUE(is_accepted(token{token_kind::element, "Fe", 0}, table));
    EXPECT_FALSE(is_accepted(token{token_kind::element, "Fx", 0}, table));
    EXPECT_FALSE(is_accepted(token{token_kind::other, "#", 0}, table));
}

TEST(SanitizerTest, DropsRejectedTokens) {
    EXPECT_EQ(clean_copy("H2$O"), "H2O");
    EXPECT_EQ(clean_copy("XxH2O"), "H2O");
    EXPECT_EQ(clean_copy("Ca (NO3) 2"), "Ca(NO3)2");
    EXPECT_EQ(clean_copy("h2o"), "2");
    EXPECT_EQ(clean_copy(""), "");
}

TEST(SanitizerTest, DoesNotRebalanceParentheses) {
    EXPECT_EQ(clean_copy("((O)"), "((O)");
    EXPECT_EQ(clean_copy("H)"), "H)");
}

TEST(SanitizerTest, IsIdempotent) {
    const std::vector<std::string> inputs{
        "H2$O", "Ca(NO3)2", "h2o", "1$2", "C$l", "Xx(Yy3)2",
        "  Na Cl ", "((O)", "Ab1Cd2", "\xC3\x84H2", "", "!!!", "Qq9(Zz)"};
    for (const auto &f : inputs) {
        const std::string once = clean_copy(f);
        EXPECT_EQ(clean_copy(once), once) << "input: " << f;
    }
}
