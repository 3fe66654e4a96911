#include "rational.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdlib>
#include <memory>
#include <ostream>
#include <string>

namespace padic {

// Trim surrounding whitespace
static std::string trimmed(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Optional '-' followed by decimal digits only
static bool is_valid_integer_text(const std::string &s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t i = start; i < s.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

// Integer

Integer::Integer(const std::string &s) {
    mpz_init(m_val);
    std::string t = trimmed(s);
    if (!is_valid_integer_text(t) || mpz_set_str(m_val, t.c_str(), 10) != 0) {
        mpz_clear(m_val);
        throw InvalidInput("not an integer: \"" + s + "\"");
    }
}

Integer Integer::from_mpz(mpz_srcptr v) {
    Integer r;
    mpz_set(r.m_val, v);
    return r;
}

Integer Integer::pow(unsigned long base, unsigned long exp) {
    Integer r;
    mpz_ui_pow_ui(r.m_val, base, exp);
    return r;
}

long Integer::to_long() const {
    if (!fits_long())
        throw InvalidInput("integer " + to_string() + " does not fit into long");
    return mpz_get_si(m_val);
}

std::string Integer::to_string(int base) const {
    std::unique_ptr<char, decltype(&std::free)> str{
        mpz_get_str(nullptr, base, m_val), std::free};
    return str.get();
}

Integer operator+(const Integer &a, const Integer &b) {
    Integer r;
    mpz_add(r.get(), a.get(), b.get());
    return r;
}

Integer operator-(const Integer &a, const Integer &b) {
    Integer r;
    mpz_sub(r.get(), a.get(), b.get());
    return r;
}

Integer operator*(const Integer &a, const Integer &b) {
    Integer r;
    mpz_mul(r.get(), a.get(), b.get());
    return r;
}

Integer operator-(const Integer &a) {
    Integer r;
    mpz_neg(r.get(), a.get());
    return r;
}

bool operator==(const Integer &a, const Integer &b) { return mpz_cmp(a.get(), b.get()) == 0; }
bool operator!=(const Integer &a, const Integer &b) { return mpz_cmp(a.get(), b.get()) != 0; }
bool operator<(const Integer &a, const Integer &b)  { return mpz_cmp(a.get(), b.get()) < 0; }

std::ostream &operator<<(std::ostream &out, const Integer &value) {
    return out << value.to_string();
}

// Rational

Rational::Rational(long num, long den) {
    if (den == 0)
        throw InvalidInput("denominator is zero: " + std::to_string(num) + "/0");
    mpq_init(m_val);
    mpz_set_si(mpq_numref(m_val), num);
    mpz_set_si(mpq_denref(m_val), den);
    mpq_canonicalize(m_val);
}

Rational::Rational(const Integer &num, const Integer &den) {
    if (den.is_zero())
        throw InvalidInput("denominator is zero: " + num.to_string() + "/0");
    mpq_init(m_val);
    mpz_set(mpq_numref(m_val), num.get());
    mpz_set(mpq_denref(m_val), den.get());
    mpq_canonicalize(m_val);
}

Rational::Rational(const Integer &v) {
    mpq_init(m_val);
    mpq_set_z(m_val, v.get());
}

Rational::Rational(const std::string &s) {
    std::string t = trimmed(s);
    size_t slash = t.find('/');
    std::string num_text = trimmed(t.substr(0, slash));
    std::string den_text = (slash == std::string::npos) ? "1" : trimmed(t.substr(slash + 1));

    if (!is_valid_integer_text(num_text) || !is_valid_integer_text(den_text))
        throw InvalidInput("not a rational number: \"" + s + "\"");

    Integer num(num_text);
    Integer den(den_text);
    if (den.is_zero())
        throw InvalidInput("denominator is zero: \"" + s + "\"");

    mpq_init(m_val);
    mpz_set(mpq_numref(m_val), num.get());
    mpz_set(mpq_denref(m_val), den.get());
    mpq_canonicalize(m_val);
}

std::string Rational::to_string() const {
    std::unique_ptr<char, decltype(&std::free)> str{
        mpq_get_str(nullptr, 10, m_val), std::free};
    return str.get();
}

Rational operator+(const Rational &a, const Rational &b) {
    Rational r;
    mpq_add(r.m_val, a.m_val, b.m_val);
    return r;
}

Rational operator-(const Rational &a, const Rational &b) {
    Rational r;
    mpq_sub(r.m_val, a.m_val, b.m_val);
    return r;
}

Rational operator*(const Rational &a, const Rational &b) {
    Rational r;
    mpq_mul(r.m_val, a.m_val, b.m_val);
    return r;
}

Rational operator/(const Rational &a, const Rational &b) {
    if (b.is_zero())
        throw InvalidInput("division by zero: " + a.to_string() + " / 0");
    Rational r;
    mpq_div(r.m_val, a.m_val, b.m_val);
    return r;
}

Rational operator-(const Rational &a) {
    Rational r;
    mpq_neg(r.m_val, a.m_val);
    return r;
}

bool operator==(const Rational &a, const Rational &b) { return mpq_equal(a.get(), b.get()) != 0; }
bool operator!=(const Rational &a, const Rational &b) { return mpq_equal(a.get(), b.get()) == 0; }
bool operator<(const Rational &a, const Rational &b)  { return mpq_cmp(a.get(), b.get()) < 0; }

std::ostream &operator<<(std::ostream &out, const Rational &value) {
    return out << value.to_string();
}

} // namespace padic
