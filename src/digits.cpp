#include "digits.hpp"
#include "errors.hpp"

#include <map>
#include <string>

namespace padic {

namespace {

struct IntegerLess {
    bool operator()(const Integer &a, const Integer &b) const {
        return mpz_cmp(a.get(), b.get()) < 0;
    }
};

} // namespace

Expansion expand_digits(const Integer &num, const Integer &den, long p, std::size_t n) {
    if (p < 2)
        throw InvalidInput("p must be at least 2, got " + std::to_string(p));
    if (den.is_zero())
        throw InvalidInput("denominator is zero: " + num.to_string() + "/0");

    const unsigned long up = static_cast<unsigned long>(p);

    // den^-1 mod p; fails exactly when p | den
    Integer inverse;
    Integer modulus(p);
    if (mpz_invert(inverse.get(), den.get(), modulus.get()) == 0)
        throw InvalidInput("denominator " + den.to_string() +
                           " is not coprime to " + std::to_string(p));

    Expansion out;
    out.digits.reserve(n);

    std::map<Integer, std::size_t, IntegerLess> seen;
    Integer state = num;
    Integer product;

    for (std::size_t i = 0;; ++i) {
        auto [it, inserted] = seen.emplace(state, i);
        if (!inserted) {
            out.cycle = Cycle{it->second, i - it->second};
            break;
        }
        if (i == n) break;

        // a_i = state * den^-1 mod p, always in [0, p)
        mpz_mul(product.get(), state.get(), inverse.get());
        const unsigned long digit = mpz_fdiv_ui(product.get(), up);
        out.digits.push_back(static_cast<long>(digit));

        // state <- (state - a_i * den) / p
        mpz_submul_ui(state.get(), den.get(), digit);
        mpz_divexact_ui(state.get(), state.get(), up);
    }

    if (out.cycle) {
        const Cycle &c = *out.cycle;
        while (out.digits.size() < n) {
            std::size_t k = out.digits.size() - c.start;
            out.digits.push_back(out.digits[c.start + k % c.length]);
        }
    }
    return out;
}

} // namespace padic
