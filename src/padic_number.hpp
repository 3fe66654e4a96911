#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "digits.hpp"
#include "rational.hpp"

namespace padic {

constexpr long DEFAULT_PRECISION   = 20;
constexpr long DEFAULT_SHOW_DIGITS = 10;

struct SeriesTerm {
    long exponent = 0;
    long digit    = 0;
};

// First terms of a number's series plus the O(p^order) error term that
// follows them when `truncated` is set.
struct SeriesView {
    std::vector<SeriesTerm> terms;
    bool truncated = false;
    long order     = 0;
};

// Element of Q_p kept as
//   sum digits[i] * p^(valuation + i),  0 <= i < digits.size() <= precision
// with digits[0] != 0 for every non-zero value.  Immutable: every operation
// returns a new instance.
//
// A number is exact when its digits are the whole expansion (it terminated,
// or its repeating cycle was found while expanding); otherwise it is only
// known modulo p^order(), with order() == valuation + precision.  A zero can
// be inexact too: "O(p^k)" is zero modulo p^k, and its valuation() holds k.
class PAdicNumber {
public:
    // Each input kind has its own conversion path.  Throws InvalidPrime if
    // prime is not prime and InvalidPrecision if precision <= 0.
    PAdicNumber(long value, long prime, long precision = DEFAULT_PRECISION);
    PAdicNumber(const Integer &value, long prime, long precision = DEFAULT_PRECISION);
    PAdicNumber(const Rational &value, long prime, long precision = DEFAULT_PRECISION);

    // Re-reads other at a new prime/precision.  Same prime: digits are cut
    // or, following a known cycle, extended; an inexact number never gains
    // precision.  Other prime: goes through other.to_rational(), and the
    // result stays inexact if other was.
    PAdicNumber(const PAdicNumber &other, long prime, long precision = DEFAULT_PRECISION);

    PAdicNumber(const PAdicNumber &) = default;
    PAdicNumber(PAdicNumber &&) noexcept = default;
    PAdicNumber &operator=(const PAdicNumber &) = default;
    PAdicNumber &operator=(PAdicNumber &&) noexcept = default;

    static PAdicNumber from_int(long value, long prime, long precision = DEFAULT_PRECISION);
    static PAdicNumber zero(long prime, long precision = DEFAULT_PRECISION);
    // O(p^order): zero, known only modulo p^order
    static PAdicNumber approximate_zero(long prime, long order,
                                        long precision = DEFAULT_PRECISION);

    // Builds a number straight from its digits.  Leading zero digits raise
    // the valuation, trailing ones are dropped, and anything beyond
    // precision is cut (which makes the result inexact).  With exact ==
    // false the digits stand for the value modulo p^(valuation + precision):
    // leading zeros use up precision, and all zeros give approximate_zero().
    // Throws InvalidInput for a digit outside [0, prime).
    static PAdicNumber from_digits(long prime, long valuation, std::vector<long> digits,
                                   long precision = DEFAULT_PRECISION, bool exact = true);

    long prime() const noexcept     { return m_prime; }
    long precision() const noexcept { return m_precision; }
    long valuation() const noexcept { return m_valuation; }
    bool is_zero() const noexcept   { return m_is_zero; }
    bool is_exact() const noexcept  { return m_exact; }
    const std::vector<long> &digits() const noexcept { return m_digits; }
    const std::optional<Cycle> &cycle() const noexcept { return m_cycle; }

    // Exponent of the error term: the number is known modulo p^order().
    // Empty for exact numbers.
    std::optional<long> order() const;

    // This number known only modulo p^order (or its own order, if lower).
    // Digits from p^order up are dropped; nothing left gives O(p^order).
    PAdicNumber with_order(long order) const;

    // Digit of p^(valuation + index), following the cycle past the stored
    // digits; 0 where nothing is stored.
    long digit_at(std::size_t index) const;

    // Exact value when is_exact(), the truncation otherwise.  Throws
    // PrecisionExceeded if max_denominator_power is given and -valuation
    // exceeds it.
    Rational to_rational(std::optional<long> max_denominator_power = std::nullopt) const;

    // Horner value of the stored digits alone, ignoring any cycle.
    Rational truncated_rational() const;

    // Throws NotAnInteger unless valuation >= 0 and to_rational() is integral.
    Integer to_int() const;

    // Operands are read at min(precision, other.precision()) and combined as
    // exact rationals.  When an operand is inexact the result is cut to the
    // order its digits are still determined to: the lower order for add and
    // subtract, shifted by the valuations for multiply and divide.
    // Throw PrimeMismatch for different primes.
    PAdicNumber add(const PAdicNumber &other) const;
    PAdicNumber subtract(const PAdicNumber &other) const;
    PAdicNumber multiply(const PAdicNumber &other) const;
    // Also throws InvalidInput when other is zero.
    PAdicNumber divide(const PAdicNumber &other) const;
    PAdicNumber negate() const;

    // Approximate equality: both zero, or same prime and valuation with the
    // first min(precision, other.precision(), within_precision) digits equal.
    // Positions past a stored sequence read as its implicit zeros.
    // Throws InvalidPrecision if within_precision <= 0.
    bool equals(const PAdicNumber &other,
                std::optional<long> within_precision = std::nullopt) const;

    // (exponent, digit) pairs of the first show_digits terms.
    // Throws InvalidPrecision if show_digits < 0.
    SeriesView series_terms(long show_digits = DEFAULT_SHOW_DIGITS) const;

private:
    PAdicNumber() = default;

    // Validated zero of the given prime and precision
    static PAdicNumber blank(long prime, long precision);

    void assign_expansion(const Integer &num, const Integer &den);
    void strip_trailing_zeros();

    long m_prime     = 2;
    long m_precision = DEFAULT_PRECISION;
    long m_valuation = 0;
    std::vector<long>    m_digits;
    std::optional<Cycle> m_cycle;
    bool m_is_zero = true;
    bool m_exact   = true;
};

PAdicNumber operator+(const PAdicNumber &a, const PAdicNumber &b);
PAdicNumber operator-(const PAdicNumber &a, const PAdicNumber &b);
PAdicNumber operator*(const PAdicNumber &a, const PAdicNumber &b);
PAdicNumber operator/(const PAdicNumber &a, const PAdicNumber &b);
PAdicNumber operator-(const PAdicNumber &a);

bool operator==(const PAdicNumber &a, const PAdicNumber &b);
bool operator!=(const PAdicNumber &a, const PAdicNumber &b);

} // namespace padic
