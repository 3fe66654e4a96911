#include <gtest/gtest.h>
#include "errors.hpp"
#include "series.hpp"

#include <sstream>

using padic::PAdicNumber;
using padic::Rational;
using padic::parse_padic;
using padic::parse_series;
using padic::to_series_string;

class SeriesSuite : public ::testing::Test {};

// --- formatting ---

TEST_F(SeriesSuite, FormatsFiniteSeries) {
    EXPECT_EQ(to_series_string(PAdicNumber(82, 5)), "2 + 1*5 + 3*5^2");
    EXPECT_EQ(to_series_string(PAdicNumber(Rational(7, 25), 5)), "2/5^2 + 1/5");
    EXPECT_EQ(to_series_string(PAdicNumber(Rational(1, 3), 3)), "1/3");
    EXPECT_EQ(to_series_string(PAdicNumber(8, 2)), "1*2^3");
}

TEST_F(SeriesSuite, ZeroDigitsAreSkipped) {
    EXPECT_EQ(to_series_string(PAdicNumber(126, 5)), "1 + 1*5^3");
}

TEST_F(SeriesSuite, RepeatingSeriesEndsInOrderTerm) {
    EXPECT_EQ(to_series_string(PAdicNumber(Rational(1, 2), 5), 3), "3 + 2*5 + 2*5^2 + O(5^3)");
    EXPECT_EQ(to_series_string(PAdicNumber(-1, 3), 2), "2 + 2*3 + O(3^2)");
    EXPECT_EQ(to_series_string(PAdicNumber(Rational(-3, 5), 5), 1), "2/5 + O(1)");
    EXPECT_EQ(to_series_string(PAdicNumber(Rational(-3, 5), 5), 2), "2/5 + 4 + O(5)");
}

TEST_F(SeriesSuite, ShowLimitTruncatesFiniteSeries) {
    EXPECT_EQ(to_series_string(PAdicNumber(82, 5), 2), "2 + 1*5 + O(5^2)");
    EXPECT_EQ(to_series_string(PAdicNumber(82, 5), 0), "O(1)");
}

TEST_F(SeriesSuite, ZeroPrintsAsZero) {
    EXPECT_EQ(to_series_string(PAdicNumber::zero(7)), "0");
}

TEST_F(SeriesSuite, StreamOperator) {
    std::ostringstream out;
    out << PAdicNumber(42, 5);
    EXPECT_EQ(out.str(), "2 + 3*5 + 1*5^2");
}

// --- parsing ---

TEST_F(SeriesSuite, ParsesTerms) {
    auto s = parse_series("2 + 1*5 + 3*5^2 + O(5^3)", 5);
    EXPECT_EQ(s.valuation, 0);
    EXPECT_EQ(s.digits, (std::vector<long>{2, 1, 3}));
    ASSERT_TRUE(s.order.has_value());
    EXPECT_EQ(*s.order, 3);
}

TEST_F(SeriesSuite, TermsInAnyOrderWithGaps) {
    auto s = parse_series("1*5^3+3", 5);
    EXPECT_EQ(s.valuation, 0);
    EXPECT_EQ(s.digits, (std::vector<long>{3, 0, 0, 1}));
    EXPECT_FALSE(s.order.has_value());

    auto neg = parse_series(" 1 / 5 + 2 ", 5);
    EXPECT_EQ(neg.valuation, -1);
    EXPECT_EQ(neg.digits, (std::vector<long>{1, 2}));
}

TEST_F(SeriesSuite, ZeroTermsDoNotSetValuation) {
    auto s = parse_series("0 + 0*5 + 4*5^2", 5);
    EXPECT_EQ(s.valuation, 2);
    EXPECT_EQ(s.digits, (std::vector<long>{4}));
}

TEST_F(SeriesSuite, ReconstructsValue) {
    PAdicNumber x = parse_padic("1/5 + 2 + 3*5", 5);
    EXPECT_EQ(x.valuation(), -1);
    EXPECT_TRUE(x.is_exact());
    EXPECT_EQ(x.to_rational(), Rational(86, 5));
    EXPECT_EQ(x.precision(), padic::DEFAULT_PRECISION);
}

TEST_F(SeriesSuite, OrderTermSetsPrecision) {
    PAdicNumber x = parse_padic("2 + 1*5 + 3*5^2 + O(5^3)", 5);
    EXPECT_EQ(x.precision(), 3);
    EXPECT_FALSE(x.is_exact());
    EXPECT_EQ(to_series_string(x), "2 + 1*5 + 3*5^2 + O(5^3)");

    PAdicNumber y = parse_padic("1/5^3 + O(5^-1)", 5);
    EXPECT_EQ(y.valuation(), -3);
    EXPECT_EQ(y.precision(), 2);
    EXPECT_EQ(to_series_string(y), "1/5^3 + O(5^-1)");
}

TEST_F(SeriesSuite, BareOrderTermIsInexactZero) {
    PAdicNumber x = parse_padic("O(5^2)", 5);
    EXPECT_TRUE(x.is_zero());
    EXPECT_FALSE(x.is_exact());
    EXPECT_EQ(to_series_string(x), "O(5^2)");
    EXPECT_EQ(*x.order(), 2);
}

TEST_F(SeriesSuite, BareOrderTermKeepsItsOrder) {
    EXPECT_EQ(to_series_string(parse_padic("O(1)", 5)), "O(1)");
    EXPECT_EQ(to_series_string(parse_padic("O(5)", 5)), "O(5)");

    PAdicNumber x = parse_padic("O(5^-3)", 5);
    EXPECT_EQ(x.valuation(), -3);
    EXPECT_EQ(to_series_string(x), "O(5^-3)");
}

TEST_F(SeriesSuite, OrderTermCapsExplicitPrecision) {
    PAdicNumber x = parse_padic("1 + 2*5 + O(5^2)", 5, 10);
    EXPECT_EQ(x.precision(), 2);
    EXPECT_EQ(*x.order(), 2);
    EXPECT_EQ(parse_padic("1 + O(5^4)", 5, 2).precision(), 2);
}

TEST_F(SeriesSuite, RejectsExponentsOutOfRange) {
    const char *bad[] = {
        "1*5^9223372036854775807 + 1/5^9223372036854775807",
        "1/5^9223372036854775807",
        "1*5^1000001",
        "1*5^99999999999999999999",
        "1 + O(5^9223372036854775807)",
        "1 + O(5^100000)",                // span with the O-term
        "1/5^60000 + 1*5^60000",
    };
    for (const char *text : bad) {
        EXPECT_THROW(parse_series(text, 5), padic::InvalidInput) << text;
        EXPECT_FALSE(padic::validate_series(text, 5)) << text;
    }
    EXPECT_TRUE(padic::validate_series("1*5^1000000", 5));
    EXPECT_TRUE(padic::validate_series("1/5^1000000 + O(5^-999990)", 5));
}

TEST_F(SeriesSuite, ExplicitPrecisionWins) {
    PAdicNumber x = parse_padic("1 + 2*5 + 3*5^2", 5, 2);
    EXPECT_EQ(x.precision(), 2);
    EXPECT_EQ(x.digits(), (std::vector<long>{1, 2}));
    EXPECT_FALSE(x.is_exact());
}

TEST_F(SeriesSuite, FormatThenParse) {
    for (long n : {1L, 42L, 82L, 1000L}) {
        PAdicNumber x(n, 5);
        EXPECT_EQ(parse_padic(to_series_string(x), 5).to_rational(), Rational(n)) << n;
    }
    PAdicNumber frac(Rational(7, 25), 5);
    EXPECT_EQ(parse_padic(to_series_string(frac), 5).to_rational(), Rational(7, 25));
}

TEST_F(SeriesSuite, RejectsMalformedSeries) {
    const char *bad[] = {
        "",
        "abc",
        "2 + 1*7",            // wrong base
        "5",                  // digit out of range
        "1 + 2",              // exponent 0 twice
        "O(5^2) + 1",         // O-term not last
        "1*5^3 + O(5^2)",     // term past the O-term
        "1 +",
        "1*5^",
        "2*5*5",
        "O(7)",
    };
    for (const char *text : bad) {
        EXPECT_THROW(parse_series(text, 5), padic::InvalidInput) << text;
        EXPECT_FALSE(padic::validate_series(text, 5)) << text;
    }
}

TEST_F(SeriesSuite, RejectsNonPrimeBase) {
    EXPECT_THROW(parse_series("1 + 1*4", 4), padic::InvalidPrime);
    EXPECT_FALSE(padic::validate_series("1", 4));
}

TEST_F(SeriesSuite, ValidSeries) {
    EXPECT_TRUE(padic::validate_series("3 + 2*5 + 2*5^2 + O(5^3)", 5));
    EXPECT_TRUE(padic::validate_series("1/5^2 + O(1)", 5));
    EXPECT_TRUE(padic::validate_series("0", 5));
}
