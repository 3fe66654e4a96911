#include "padic_number.hpp"
#include "errors.hpp"
#include "primes.hpp"
#include "reconstruct.hpp"
#include "valuation.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace padic {

namespace {

void check_prime(long prime) {
    if (!is_prime(prime))
        throw InvalidPrime("p must be prime, got " + std::to_string(prime));
}

void check_precision(long precision) {
    if (precision <= 0)
        throw InvalidPrecision("precision must be a positive integer, got " +
                               std::to_string(precision));
}

void check_same_prime(const PAdicNumber &a, const PAdicNumber &b, const char *op) {
    if (a.prime() != b.prime())
        throw PrimeMismatch(std::string("cannot ") + op + " a " +
                            std::to_string(a.prime()) + "-adic and a " +
                            std::to_string(b.prime()) + "-adic number");
}

std::optional<long> lower_order(std::optional<long> a, std::optional<long> b) {
    if (!a) return b;
    if (!b) return a;
    return std::min(*a, *b);
}

bool is_exact_zero(const PAdicNumber &x) {
    return x.is_zero() && x.is_exact();
}

std::optional<long> sum_order(const PAdicNumber &x, const PAdicNumber &y) {
    return lower_order(x.order(), y.order());
}

// x*y + O(p^(ox + vy)) + O(p^(oy + vx))
std::optional<long> product_order(const PAdicNumber &x, const PAdicNumber &y) {
    if (is_exact_zero(x) || is_exact_zero(y)) return std::nullopt;
    std::optional<long> from_x, from_y;
    if (x.order()) from_x = *x.order() + y.valuation();
    if (y.order()) from_y = *y.order() + x.valuation();
    return lower_order(from_x, from_y);
}

// x/y + O(p^(ox - vy)) + O(p^(oy + vx - 2vy))
std::optional<long> quotient_order(const PAdicNumber &x, const PAdicNumber &y) {
    if (is_exact_zero(x)) return std::nullopt;
    std::optional<long> from_x, from_y;
    if (x.order()) from_x = *x.order() - y.valuation();
    if (y.order()) from_y = *y.order() + x.valuation() - 2 * y.valuation();
    return lower_order(from_x, from_y);
}

// Both operands re-read at the smaller precision, combined exactly,
// re-expanded at that precision and cut to the order the operands allow
template <typename Op, typename Order>
PAdicNumber combine(const PAdicNumber &a, const PAdicNumber &b, Op op, Order order_of) {
    const long precision = std::min(a.precision(), b.precision());
    PAdicNumber x(a, a.prime(), precision);
    PAdicNumber y(b, b.prime(), precision);

    PAdicNumber result(op(x.to_rational(), y.to_rational()), a.prime(), precision);
    if (std::optional<long> order = order_of(x, y))
        return result.with_order(*order);
    return result;
}

} // namespace

PAdicNumber PAdicNumber::blank(long prime, long precision) {
    check_prime(prime);
    check_precision(precision);
    PAdicNumber x;
    x.m_prime     = prime;
    x.m_precision = precision;
    return x;
}

// Construction

PAdicNumber::PAdicNumber(long value, long prime, long precision)
    : PAdicNumber(Integer(value), prime, precision) {}

PAdicNumber::PAdicNumber(const Integer &value, long prime, long precision)
    : PAdicNumber(blank(prime, precision)) {
    if (!value.is_zero()) assign_expansion(value, Integer(1));
}

PAdicNumber::PAdicNumber(const Rational &value, long prime, long precision)
    : PAdicNumber(blank(prime, precision)) {
    if (!value.is_zero()) assign_expansion(value.numerator(), value.denominator());
}

PAdicNumber::PAdicNumber(const PAdicNumber &other, long prime, long precision)
    : PAdicNumber(blank(prime, precision)) {
    m_exact = other.m_exact;
    if (other.m_is_zero) {
        // O(p^k) says nothing about another prime
        if (other.m_prime == prime) m_valuation = other.m_valuation;
        return;
    }

    if (other.m_prime != prime) {
        Rational value = other.to_rational();
        assign_expansion(value.numerator(), value.denominator());
        if (!other.m_exact) *this = with_order(m_valuation + m_precision);
        return;
    }

    // digits past other's order are unknown
    if (!other.m_exact) m_precision = std::min(m_precision, other.m_precision);

    const size_t limit = static_cast<size_t>(m_precision);
    m_is_zero   = false;
    m_valuation = other.m_valuation;

    if (other.m_cycle) {
        const Cycle &c = *other.m_cycle;
        m_digits.reserve(limit);
        for (size_t i = 0; i < limit; ++i)
            m_digits.push_back(other.digit_at(i));
        // the cycle survives only if a whole period is still stored
        if (c.start + c.length <= limit) {
            m_cycle = c;
        } else {
            m_exact = false;
            strip_trailing_zeros();
        }
        return;
    }

    m_digits = other.m_digits;
    if (m_digits.size() > limit) {
        m_digits.resize(limit);
        m_exact = false;
    }
    strip_trailing_zeros();
}

PAdicNumber PAdicNumber::from_int(long value, long prime, long precision) {
    return PAdicNumber(value, prime, precision);
}

PAdicNumber PAdicNumber::zero(long prime, long precision) {
    return blank(prime, precision);
}

PAdicNumber PAdicNumber::approximate_zero(long prime, long order, long precision) {
    PAdicNumber x = blank(prime, precision);
    x.m_exact     = false;
    x.m_valuation = order;
    return x;
}

PAdicNumber PAdicNumber::from_digits(long prime, long valuation, std::vector<long> digits,
                                     long precision, bool exact) {
    PAdicNumber x = blank(prime, precision);
    x.m_exact = exact;

    for (long d : digits) {
        if (d < 0 || d >= prime)
            throw InvalidInput("digit " + std::to_string(d) + " is outside [0, " +
                               std::to_string(prime) + ")");
    }

    auto first = std::find_if(digits.begin(), digits.end(), [](long d) { return d != 0; });
    const long shift = static_cast<long>(first - digits.begin());
    if (!exact && (first == digits.end() || shift >= precision))
        return approximate_zero(prime, valuation + precision, precision);
    if (first == digits.end()) return x;

    x.m_is_zero   = false;
    x.m_valuation = valuation + shift;
    if (!exact) x.m_precision = precision - shift;
    x.m_digits.assign(first, digits.end());
    if (x.m_digits.size() > static_cast<size_t>(x.m_precision)) {
        x.m_digits.resize(static_cast<size_t>(x.m_precision));
        x.m_exact = false;
    }
    x.strip_trailing_zeros();
    return x;
}

void PAdicNumber::assign_expansion(const Integer &num, const Integer &den) {
    Valuation v = extract_valuation(num, den, m_prime);
    Expansion e = expand_digits(v.num, v.den, m_prime, static_cast<size_t>(m_precision));

    m_is_zero   = false;
    m_valuation = v.valuation;
    m_digits    = std::move(e.digits);
    m_exact     = e.cycle.has_value();
    m_cycle.reset();

    if (e.cycle) {
        const Cycle &c = *e.cycle;
        bool all_zero = std::all_of(m_digits.begin() + c.start,
                                    m_digits.begin() + c.start + c.length,
                                    [](long d) { return d == 0; });
        // a cycle of zeros is a terminating expansion
        if (all_zero)
            m_digits.resize(c.start);
        else
            m_cycle = c;
    }
    if (!m_cycle) strip_trailing_zeros();
}

void PAdicNumber::strip_trailing_zeros() {
    while (!m_digits.empty() && m_digits.back() == 0)
        m_digits.pop_back();
}

long PAdicNumber::digit_at(size_t index) const {
    if (index < m_digits.size()) return m_digits[index];
    if (m_cycle && index >= m_cycle->start)
        return m_digits[m_cycle->start + (index - m_cycle->start) % m_cycle->length];
    return 0;
}

std::optional<long> PAdicNumber::order() const {
    if (m_exact) return std::nullopt;
    if (m_is_zero) return m_valuation;
    return m_valuation + m_precision;
}

PAdicNumber PAdicNumber::with_order(long order) const {
    if (std::optional<long> known = this->order()) order = std::min(order, *known);
    if (m_is_zero || order <= m_valuation) return approximate_zero(m_prime, order, m_precision);

    PAdicNumber x = blank(m_prime, m_precision);
    x.m_exact     = false;
    x.m_is_zero   = false;
    x.m_valuation = m_valuation;
    x.m_precision = std::min(order - m_valuation, m_precision);

    const size_t keep = static_cast<size_t>(x.m_precision);
    x.m_digits.reserve(keep);
    for (size_t i = 0; i < keep; ++i)
        x.m_digits.push_back(digit_at(i));
    x.strip_trailing_zeros();
    return x;
}

// Conversion

Rational PAdicNumber::to_rational(std::optional<long> max_denominator_power) const {
    if (m_is_zero) return Rational();

    if (max_denominator_power && -m_valuation > *max_denominator_power)
        throw PrecisionExceeded("value needs p^" + std::to_string(-m_valuation) +
                                " in the denominator, limit is p^" +
                                std::to_string(*max_denominator_power));

    if (m_cycle)
        return reconstruct_periodic(m_valuation, m_digits, *m_cycle, m_prime);
    return reconstruct_series(m_valuation, m_digits, m_prime);
}

Rational PAdicNumber::truncated_rational() const {
    if (m_is_zero) return Rational();
    return reconstruct_series(m_valuation, m_digits, m_prime);
}

Integer PAdicNumber::to_int() const {
    if (m_is_zero) return Integer();
    if (m_valuation < 0)
        throw NotAnInteger("valuation " + std::to_string(m_valuation) +
                           " is negative, the value is not an integer");

    Rational value = to_rational();
    if (!value.is_integer())
        throw NotAnInteger(value.to_string() + " is not an integer");
    return value.numerator();
}

// Arithmetic

PAdicNumber PAdicNumber::add(const PAdicNumber &other) const {
    check_same_prime(*this, other, "add");
    return combine(*this, other,
                   [](const Rational &x, const Rational &y) { return x + y; }, sum_order);
}

PAdicNumber PAdicNumber::subtract(const PAdicNumber &other) const {
    check_same_prime(*this, other, "subtract");
    return combine(*this, other,
                   [](const Rational &x, const Rational &y) { return x - y; }, sum_order);
}

PAdicNumber PAdicNumber::multiply(const PAdicNumber &other) const {
    check_same_prime(*this, other, "multiply");
    return combine(*this, other,
                   [](const Rational &x, const Rational &y) { return x * y; }, product_order);
}

PAdicNumber PAdicNumber::divide(const PAdicNumber &other) const {
    check_same_prime(*this, other, "divide");
    if (other.m_is_zero)
        throw InvalidInput("division by a zero " + std::to_string(m_prime) + "-adic number");
    return combine(*this, other,
                   [](const Rational &x, const Rational &y) { return x / y; }, quotient_order);
}

PAdicNumber PAdicNumber::negate() const {
    if (m_is_zero) return *this;
    PAdicNumber x(-to_rational(), m_prime, m_precision);
    if (!m_exact) return x.with_order(m_valuation + m_precision);
    return x;
}

// Comparison

bool PAdicNumber::equals(const PAdicNumber &other, std::optional<long> within_precision) const {
    if (within_precision && *within_precision <= 0)
        throw InvalidPrecision("within_precision must be positive, got " +
                               std::to_string(*within_precision));

    if (m_is_zero || other.m_is_zero) return m_is_zero && other.m_is_zero;
    if (m_prime != other.m_prime || m_valuation != other.m_valuation) return false;

    long n = std::min(m_precision, other.m_precision);
    if (within_precision) n = std::min(n, *within_precision);

    for (size_t i = 0; i < static_cast<size_t>(n); ++i) {
        if (digit_at(i) != other.digit_at(i)) return false;
    }
    return true;
}

SeriesView PAdicNumber::series_terms(long show_digits) const {
    if (show_digits < 0)
        throw InvalidPrecision("show_digits must not be negative, got " +
                               std::to_string(show_digits));

    SeriesView view;
    if (m_is_zero) {
        view.truncated = !m_exact;
        view.order     = m_valuation;
        return view;
    }

    // how many digits are actually known
    size_t available;
    if (m_cycle)
        available = std::numeric_limits<size_t>::max();
    else if (m_exact)
        available = m_digits.size();
    else
        available = static_cast<size_t>(m_precision);

    const size_t shown = std::min(available, static_cast<size_t>(show_digits));
    view.terms.reserve(shown);
    for (size_t i = 0; i < shown; ++i)
        view.terms.push_back({m_valuation + static_cast<long>(i), digit_at(i)});

    view.truncated = !m_exact || m_cycle.has_value() || shown < available;
    view.order     = m_valuation + static_cast<long>(shown);
    return view;
}

PAdicNumber operator+(const PAdicNumber &a, const PAdicNumber &b) { return a.add(b); }
PAdicNumber operator-(const PAdicNumber &a, const PAdicNumber &b) { return a.subtract(b); }
PAdicNumber operator*(const PAdicNumber &a, const PAdicNumber &b) { return a.multiply(b); }
PAdicNumber operator/(const PAdicNumber &a, const PAdicNumber &b) { return a.divide(b); }
PAdicNumber operator-(const PAdicNumber &a) { return a.negate(); }

bool operator==(const PAdicNumber &a, const PAdicNumber &b) { return a.equals(b); }
bool operator!=(const PAdicNumber &a, const PAdicNumber &b) { return !a.equals(b); }

} // namespace padic
