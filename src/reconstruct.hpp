#pragma once
#include <vector>

#include "digits.hpp"
#include "rational.hpp"

namespace padic {

// sum digits[i] * p^(valuation + i), evaluated with Horner's scheme from the
// highest-order digit down.  The result is exact for the given digits; it is
// the true p-adic value only when the expansion terminated, otherwise a
// truncation accurate modulo p^(valuation + digits.size()).
Rational reconstruct_series(long valuation, const std::vector<long> &digits, long p);

// Exact value of an eventually periodic expansion:
//   p^v * (A + p^s * C / (1 - p^L))
// A = pre-period digits[0, s), C = one period digits[s, s + L).
// Throws InvalidInput if the cycle is empty or does not fit inside digits.
Rational reconstruct_periodic(long valuation, const std::vector<long> &digits,
                              const Cycle &cycle, long p);

} // namespace padic
