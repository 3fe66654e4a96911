#pragma once
#include <iosfwd>
#include <string>

#include <gmp.h>

// Arbitrary-precision boundary types.  Both are thin RAII owners of a GMP
// value; copies are deep, moves swap the underlying limbs.

namespace padic {

// Signed integer over mpz_t.
class Integer {
public:
    Integer()        { mpz_init(m_val); }
    Integer(long v)  { mpz_init_set_si(m_val, v); }

    // Decimal text with optional leading '-'.  Throws InvalidInput.
    explicit Integer(const std::string &s);

    Integer(const Integer &other) { mpz_init_set(m_val, other.m_val); }
    Integer(Integer &&other) noexcept {
        mpz_init(m_val);
        mpz_swap(m_val, other.m_val);
    }
    Integer &operator=(const Integer &other) {
        if (this != &other) mpz_set(m_val, other.m_val);
        return *this;
    }
    Integer &operator=(Integer &&other) noexcept {
        mpz_swap(m_val, other.m_val);
        return *this;
    }
    ~Integer() { mpz_clear(m_val); }

    mpz_srcptr get() const noexcept { return m_val; }
    mpz_ptr     get() noexcept       { return m_val; }

    int  sign() const noexcept    { return mpz_sgn(m_val); }
    bool is_zero() const noexcept { return mpz_sgn(m_val) == 0; }
    bool fits_long() const noexcept { return mpz_fits_slong_p(m_val) != 0; }

    // Throws InvalidInput if the value does not fit.
    long to_long() const;

    std::string to_string(int base = 10) const;

    static Integer from_mpz(mpz_srcptr v);
    // base^exp
    static Integer pow(unsigned long base, unsigned long exp);

private:
    mpz_t m_val;
};

Integer operator+(const Integer &a, const Integer &b);
Integer operator-(const Integer &a, const Integer &b);
Integer operator*(const Integer &a, const Integer &b);
Integer operator-(const Integer &a);

bool operator==(const Integer &a, const Integer &b);
bool operator!=(const Integer &a, const Integer &b);
bool operator<(const Integer &a, const Integer &b);

std::ostream &operator<<(std::ostream &out, const Integer &value);


// Exact rational over mpq_t.  Always kept in lowest terms with a positive
// denominator, so numerator()/denominator() are bit-exact.
class Rational {
public:
    Rational()       { mpq_init(m_val); }
    Rational(long v) { mpq_init(m_val); mpq_set_si(m_val, v, 1); }

    // Throws InvalidInput if den == 0.
    Rational(long num, long den);
    Rational(const Integer &num, const Integer &den);
    Rational(const Integer &v);

    // "n" or "n/d", surrounding spaces allowed.  Throws InvalidInput.
    explicit Rational(const std::string &s);

    Rational(const Rational &other) { mpq_init(m_val); mpq_set(m_val, other.m_val); }
    Rational(Rational &&other) noexcept {
        mpq_init(m_val);
        mpq_swap(m_val, other.m_val);
    }
    Rational &operator=(const Rational &other) {
        if (this != &other) mpq_set(m_val, other.m_val);
        return *this;
    }
    Rational &operator=(Rational &&other) noexcept {
        mpq_swap(m_val, other.m_val);
        return *this;
    }
    ~Rational() { mpq_clear(m_val); }

    mpq_srcptr get() const noexcept { return m_val; }

    Integer numerator() const   { return Integer::from_mpz(mpq_numref(m_val)); }
    Integer denominator() const { return Integer::from_mpz(mpq_denref(m_val)); }

    int  sign() const noexcept       { return mpq_sgn(m_val); }
    bool is_zero() const noexcept    { return mpq_sgn(m_val) == 0; }
    bool is_integer() const noexcept { return mpz_cmp_ui(mpq_denref(m_val), 1) == 0; }

    // "n" for integers, "n/d" otherwise
    std::string to_string() const;

private:
    mpq_t m_val;

    friend Rational operator+(const Rational &a, const Rational &b);
    friend Rational operator-(const Rational &a, const Rational &b);
    friend Rational operator*(const Rational &a, const Rational &b);
    friend Rational operator/(const Rational &a, const Rational &b);
    friend Rational operator-(const Rational &a);
};

Rational operator+(const Rational &a, const Rational &b);
Rational operator-(const Rational &a, const Rational &b);
Rational operator*(const Rational &a, const Rational &b);
// Throws InvalidInput on division by zero.
Rational operator/(const Rational &a, const Rational &b);
Rational operator-(const Rational &a);

bool operator==(const Rational &a, const Rational &b);
bool operator!=(const Rational &a, const Rational &b);
bool operator<(const Rational &a, const Rational &b);

std::ostream &operator<<(std::ostream &out, const Rational &value);

} // namespace padic
