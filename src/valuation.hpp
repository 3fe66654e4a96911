#pragma once
#include "rational.hpp"

namespace padic {

// num/den = p^valuation * num'/den' with p dividing neither num' nor den'.
// The sign travels with num'; den' is positive.
struct Valuation {
    long    valuation = 0;
    Integer num;
    Integer den;
};

// Factors the exact power of p out of num and den.
// Throws InvalidInput if den == 0, num == 0 (zero has no valuation and must be
// handled by the caller) or p < 2.
Valuation extract_valuation(const Integer &num, const Integer &den, long p);
Valuation extract_valuation(const Rational &value, long p);

} // namespace padic
