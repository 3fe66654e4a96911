#include "valuation.hpp"
#include "errors.hpp"

#include <string>

namespace padic {

// Divides v by p while it stays divisible; returns how many times it did
static long strip_factor(Integer &v, unsigned long p) {
    long count = 0;
    while (mpz_divisible_ui_p(v.get(), p)) {
        mpz_divexact_ui(v.get(), v.get(), p);
        ++count;
    }
    return count;
}

Valuation extract_valuation(const Integer &num, const Integer &den, long p) {
    if (p < 2)
        throw InvalidInput("p must be at least 2, got " + std::to_string(p));
    if (den.is_zero())
        throw InvalidInput("denominator is zero: " + num.to_string() + "/0");
    if (num.is_zero())
        throw InvalidInput("zero has no p-adic valuation");

    Valuation result;
    result.num = num;
    result.den = den;
    if (result.den.sign() < 0) {
        mpz_neg(result.num.get(), result.num.get());
        mpz_neg(result.den.get(), result.den.get());
    }

    const unsigned long up = static_cast<unsigned long>(p);
    result.valuation += strip_factor(result.num, up);
    result.valuation -= strip_factor(result.den, up);
    return result;
}

Valuation extract_valuation(const Rational &value, long p) {
    return extract_valuation(value.numerator(), value.denominator(), p);
}

} // namespace padic
