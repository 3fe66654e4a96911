#include <gtest/gtest.h>
#include "errors.hpp"
#include "valuation.hpp"

using padic::Integer;
using padic::Rational;
using padic::extract_valuation;

class ValuationSuite : public ::testing::Test {};

TEST_F(ValuationSuite, FactorInNumerator) {
    auto v = extract_valuation(Integer(50), Integer(3), 5);
    EXPECT_EQ(v.valuation, 2);
    EXPECT_EQ(v.num, Integer(2));
    EXPECT_EQ(v.den, Integer(3));
}

TEST_F(ValuationSuite, FactorInDenominator) {
    auto v = extract_valuation(Rational(7, 25), 5);
    EXPECT_EQ(v.valuation, -2);
    EXPECT_EQ(v.num, Integer(7));
    EXPECT_EQ(v.den, Integer(1));
}

TEST_F(ValuationSuite, UnitHasValuationZero) {
    auto v = extract_valuation(Rational(3, 7), 5);
    EXPECT_EQ(v.valuation, 0);
    EXPECT_EQ(v.num, Integer(3));
    EXPECT_EQ(v.den, Integer(7));
}

TEST_F(ValuationSuite, SignMovesToNumerator) {
    // 7 / -10 = 5^-1 * (-7/2)
    auto v = extract_valuation(Integer(7), Integer(-10), 5);
    EXPECT_EQ(v.valuation, -1);
    EXPECT_EQ(v.num, Integer(-7));
    EXPECT_EQ(v.den, Integer(2));
}

TEST_F(ValuationSuite, UnreducedInputCancels) {
    // 10/5 carries one factor on each side
    auto v = extract_valuation(Integer(10), Integer(5), 5);
    EXPECT_EQ(v.valuation, 0);
    EXPECT_EQ(v.num, Integer(2));
    EXPECT_EQ(v.den, Integer(1));
}

TEST_F(ValuationSuite, LargePowers) {
    auto v = extract_valuation(Integer::pow(2, 100) * Integer(3), Integer(1), 2);
    EXPECT_EQ(v.valuation, 100);
    EXPECT_EQ(v.num, Integer(3));
}

TEST_F(ValuationSuite, RejectsBadInput) {
    EXPECT_THROW(extract_valuation(Integer(0), Integer(1), 5), padic::InvalidInput);
    EXPECT_THROW(extract_valuation(Integer(1), Integer(0), 5), padic::InvalidInput);
    EXPECT_THROW(extract_valuation(Integer(1), Integer(1), 1), padic::InvalidInput);
}
