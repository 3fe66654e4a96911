#include <gtest/gtest.h>
#include "errors.hpp"
#include "reconstruct.hpp"

using padic::Cycle;
using padic::Rational;
using padic::reconstruct_periodic;
using padic::reconstruct_series;

class ReconstructSuite : public ::testing::Test {};

TEST_F(ReconstructSuite, HornerSum) {
    // 2 + 1*5 + 3*25
    EXPECT_EQ(reconstruct_series(0, {2, 1, 3}, 5), Rational(82));
    EXPECT_EQ(reconstruct_series(2, {1}, 7), Rational(49));
}

TEST_F(ReconstructSuite, NegativeValuation) {
    EXPECT_EQ(reconstruct_series(-2, {2, 1}, 5), Rational(7, 25));
    EXPECT_EQ(reconstruct_series(-3, {1, 1}, 2), Rational(3, 8));
}

TEST_F(ReconstructSuite, EmptyOrZeroDigits) {
    EXPECT_TRUE(reconstruct_series(0, {}, 5).is_zero());
    EXPECT_TRUE(reconstruct_series(-4, {0, 0}, 5).is_zero());
}

TEST_F(ReconstructSuite, PeriodicClosedForm) {
    EXPECT_EQ(reconstruct_periodic(0, {3, 2}, Cycle{1, 1}, 5), Rational(1, 2));
    EXPECT_EQ(reconstruct_periodic(0, {2}, Cycle{0, 1}, 3), Rational(-1));
    EXPECT_EQ(reconstruct_periodic(0, {4, 0, 2, 1, 4, 2, 3}, Cycle{1, 6}, 5), Rational(3, 7));
    EXPECT_EQ(reconstruct_periodic(-1, {2, 4}, Cycle{1, 1}, 5), Rational(-3, 5));
    EXPECT_EQ(reconstruct_periodic(1, {4, 1, 3}, Cycle{1, 2}, 5), Rational(10, 3));
}

TEST_F(ReconstructSuite, ExtraDigitsPastFirstPeriodAreIgnored) {
    EXPECT_EQ(reconstruct_periodic(0, {3, 2, 2, 2, 2}, Cycle{1, 1}, 5), Rational(1, 2));
}

TEST_F(ReconstructSuite, BadCycle) {
    EXPECT_THROW(reconstruct_periodic(0, {3, 2}, Cycle{1, 0}, 5), padic::InvalidInput);
    EXPECT_THROW(reconstruct_periodic(0, {3, 2}, Cycle{1, 3}, 5), padic::InvalidInput);
}
