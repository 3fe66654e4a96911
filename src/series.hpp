#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "padic_number.hpp"

namespace padic {

struct ParsedSeries {
    long valuation = 0;
    std::vector<long> digits;      // empty for zero
    std::optional<long> order;     // exponent of a trailing O(p^k) term
};

// "2 + 1*5 + 3*5^2 + O(5^3)".  Zero digits are skipped, terms with negative
// exponents print as "d/p" and "d/p^k", and the O-term appears only when the
// series goes on past what is shown.  Zero prints as "0".
std::string to_series_string(const PAdicNumber &x, long show_digits = DEFAULT_SHOW_DIGITS);

// Accepts terms joined by '+': "d", "d*p", "d*p^k", "d/p", "d/p^k" and a
// final "O(1)", "O(p)" or "O(p^k)".  Whitespace is ignored.  |k| is limited
// to 10^6 and the terms with the O-term to a span of 10^5 exponents.
// Throws InvalidPrime for a non-prime p and InvalidInput for anything else
// that is malformed: wrong base, digit outside [0, p), repeated exponent,
// a term at or past the O-term.
ParsedSeries parse_series(const std::string &text, long prime);

// parse_series() followed by PAdicNumber::from_digits().  An O(p^k) term
// makes the number inexact with precision k - valuation (or the explicit
// precision, if lower); a bare O(p^k) is approximate_zero(prime, k).  Without
// an O-term the explicit precision, or the default (or the number of digits,
// if larger), is used.
PAdicNumber parse_padic(const std::string &text, long prime,
                        std::optional<long> precision = std::nullopt);

bool validate_series(const std::string &text, long prime);

std::ostream &operator<<(std::ostream &out, const PAdicNumber &x);

} // namespace padic
