#include <gtest/gtest.h>
#include "digits.hpp"
#include "errors.hpp"

using padic::Cycle;
using padic::Integer;
using padic::expand_digits;

class DigitExpanderSuite : public ::testing::Test {};

TEST_F(DigitExpanderSuite, RepeatingExpansion) {
    // 1/2 = 3 + 2*5 + 2*5^2 + ...
    auto e = expand_digits(Integer(1), Integer(2), 5, 5);
    EXPECT_EQ(e.digits, (std::vector<long>{3, 2, 2, 2, 2}));
    ASSERT_TRUE(e.cycle.has_value());
    EXPECT_EQ(*e.cycle, (Cycle{1, 1}));
}

TEST_F(DigitExpanderSuite, TerminatingExpansionEndsInZeroCycle) {
    auto e = expand_digits(Integer(82), Integer(1), 5, 6);
    EXPECT_EQ(e.digits, (std::vector<long>{2, 1, 3, 0, 0, 0}));
    ASSERT_TRUE(e.cycle.has_value());
    EXPECT_EQ(*e.cycle, (Cycle{3, 1}));
}

TEST_F(DigitExpanderSuite, MinusOneIsPurelyPeriodic) {
    auto e = expand_digits(Integer(-1), Integer(1), 3, 4);
    EXPECT_EQ(e.digits, (std::vector<long>{2, 2, 2, 2}));
    ASSERT_TRUE(e.cycle.has_value());
    EXPECT_EQ(*e.cycle, (Cycle{0, 1}));
}

TEST_F(DigitExpanderSuite, CycleLongerThanBudgetIsNotReported) {
    // 3/7 in base 5 has period 6
    auto e = expand_digits(Integer(3), Integer(7), 5, 3);
    EXPECT_EQ(e.digits, (std::vector<long>{4, 0, 2}));
    EXPECT_FALSE(e.cycle.has_value());

    auto full = expand_digits(Integer(3), Integer(7), 5, 10);
    EXPECT_EQ(full.digits, (std::vector<long>{4, 0, 2, 1, 4, 2, 3, 0, 2, 1}));
    ASSERT_TRUE(full.cycle.has_value());
    EXPECT_EQ(*full.cycle, (Cycle{1, 6}));
}

TEST_F(DigitExpanderSuite, DigitsStayInRange) {
    for (long p : {2L, 3L, 7L, 11L}) {
        auto e = expand_digits(Integer(-123), Integer(17), p, 40);
        ASSERT_EQ(e.digits.size(), 40u);
        for (long d : e.digits) {
            EXPECT_GE(d, 0);
            EXPECT_LT(d, p);
        }
    }
}

TEST_F(DigitExpanderSuite, ExactlyNDigits) {
    EXPECT_EQ(expand_digits(Integer(1), Integer(3), 5, 1).digits.size(), 1u);
    EXPECT_EQ(expand_digits(Integer(1), Integer(3), 5, 0).digits.size(), 0u);
}

TEST_F(DigitExpanderSuite, DenominatorMustBeCoprimeToP) {
    EXPECT_THROW(expand_digits(Integer(1), Integer(10), 5, 5), padic::InvalidInput);
    EXPECT_THROW(expand_digits(Integer(1), Integer(0), 5, 5), padic::InvalidInput);
    EXPECT_THROW(expand_digits(Integer(1), Integer(1), 1, 5), padic::InvalidInput);
}
