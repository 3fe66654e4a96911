#include "reconstruct.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <string>

namespace padic {

// Horner value of digits[begin, end) in base p: digits[begin] is the lowest term
static Integer horner(const std::vector<long> &digits, size_t begin, size_t end,
                      unsigned long p) {
    Integer acc;
    for (size_t i = end; i > begin; --i) {
        mpz_mul_ui(acc.get(), acc.get(), p);
        mpz_add_ui(acc.get(), acc.get(), static_cast<unsigned long>(digits[i - 1]));
    }
    return acc;
}

// value * p^valuation; a negative valuation becomes a p^-v denominator
static Rational scale(const Rational &value, long valuation, unsigned long p) {
    if (valuation == 0) return value;
    Integer power = Integer::pow(p, static_cast<unsigned long>(std::labs(valuation)));
    if (valuation > 0)
        return value * Rational(power);
    return value / Rational(power);
}

Rational reconstruct_series(long valuation, const std::vector<long> &digits, long p) {
    const unsigned long up = static_cast<unsigned long>(p);
    Integer acc = horner(digits, 0, digits.size(), up);
    if (acc.is_zero()) return Rational();
    return scale(Rational(acc), valuation, up);
}

Rational reconstruct_periodic(long valuation, const std::vector<long> &digits,
                              const Cycle &cycle, long p) {
    if (cycle.length == 0 || cycle.start + cycle.length > digits.size())
        throw InvalidInput("cycle [" + std::to_string(cycle.start) + ", +" +
                           std::to_string(cycle.length) + ") does not fit into " +
                           std::to_string(digits.size()) + " digits");

    const unsigned long up = static_cast<unsigned long>(p);
    Integer head  = horner(digits, 0, cycle.start, up);
    Integer tail  = horner(digits, cycle.start, cycle.start + cycle.length, up);

    // A + p^s * C / (1 - p^L) = (A * (1 - p^L) + p^s * C) / (1 - p^L)
    Integer denom = Integer(1) - Integer::pow(up, cycle.length);
    Integer numer = head * denom + Integer::pow(up, cycle.start) * tail;

    Rational value(numer, denom);
    if (value.is_zero()) return value;
    return scale(value, valuation, up);
}

} // namespace padic
