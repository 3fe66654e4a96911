#include "series.hpp"
#include "errors.hpp"
#include "primes.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <ostream>
#include <string>

namespace padic {

namespace {

// Largest exponent span a parsed series may cover, O-term included
constexpr long MAX_PARSED_SPAN = 100000;
// Largest |k| accepted in p^k; keeps exponent differences far from overflow
constexpr long MAX_PARSED_EXPONENT = 1000000;

struct Term {
    long exponent = 0;
    long digit    = 0;
};

std::string format_power(long prime, long exponent) {
    std::string p = std::to_string(prime);
    if (exponent == 1) return p;
    return p + "^" + std::to_string(exponent);
}

std::string format_term(const SeriesTerm &t, long prime) {
    std::string d = std::to_string(t.digit);
    if (t.exponent == 0) return d;
    if (t.exponent > 0)  return d + "*" + format_power(prime, t.exponent);
    return d + "/" + format_power(prime, -t.exponent);
}

std::string format_order(long order, long prime) {
    if (order == 0) return "O(1)";
    return "O(" + format_power(prime, order) + ")";
}

std::string strip_spaces(const std::string &s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s)
        if (!std::isspace(static_cast<unsigned char>(c))) r += c;
    return r;
}

std::vector<std::string> split_terms(const std::string &s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t plus = s.find('+', start);
        parts.push_back(s.substr(start, plus - start));
        if (plus == std::string::npos) break;
        start = plus + 1;
    }
    return parts;
}

[[noreturn]] void bad_term(const std::string &term, const std::string &why) {
    throw InvalidInput("bad series term \"" + term + "\": " + why);
}

// Decimal number at s[pos], advancing pos past it
long read_number(const std::string &s, size_t &pos, bool allow_sign) {
    bool negative = false;
    if (allow_sign && pos < s.size() && s[pos] == '-') {
        negative = true;
        ++pos;
    }
    if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos])))
        bad_term(s, "expected a number at position " + std::to_string(pos));

    long value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        long d = s[pos] - '0';
        if (value > (std::numeric_limits<long>::max() - d) / 10)
            bad_term(s, "number is too large");
        value = value * 10 + d;
        ++pos;
    }
    return negative ? -value : value;
}

// "p" or "p^k" starting at pos; returns k
long read_power(const std::string &s, size_t &pos, long prime) {
    long base = read_number(s, pos, false);
    if (base != prime)
        bad_term(s, "base " + std::to_string(base) + " does not match p = " +
                        std::to_string(prime));
    if (pos == s.size() || s[pos] != '^') return 1;
    ++pos;
    long k = read_number(s, pos, true);
    if (k > MAX_PARSED_EXPONENT || k < -MAX_PARSED_EXPONENT)
        bad_term(s, "exponent " + std::to_string(k) + " is out of range");
    return k;
}

bool is_order_term(const std::string &s) {
    return s.size() >= 3 && s[0] == 'O' && s[1] == '(' && s.back() == ')';
}

long parse_order(const std::string &s, long prime) {
    std::string inner = s.substr(2, s.size() - 3);
    if (inner == "1") return 0;
    size_t pos = 0;
    long k = read_power(inner, pos, prime);
    if (pos != inner.size()) bad_term(s, "unexpected text after the power");
    return k;
}

Term parse_term(const std::string &s, long prime) {
    if (s.empty()) bad_term(s, "empty term");

    Term t;
    size_t pos = 0;
    t.digit = read_number(s, pos, false);
    if (t.digit >= prime)
        bad_term(s, "digit " + std::to_string(t.digit) + " is outside [0, " +
                        std::to_string(prime) + ")");
    if (pos == s.size()) return t;

    char op = s[pos++];
    if (op != '*' && op != '/') bad_term(s, "expected '*' or '/'");

    long k = read_power(s, pos, prime);
    if (pos != s.size()) bad_term(s, "unexpected text after the power");
    t.exponent = (op == '*') ? k : -k;
    return t;
}

} // namespace

std::string to_series_string(const PAdicNumber &x, long show_digits) {
    SeriesView view = x.series_terms(show_digits);

    std::string out;
    for (const SeriesTerm &t : view.terms) {
        if (t.digit == 0) continue;
        if (!out.empty()) out += " + ";
        out += format_term(t, x.prime());
    }
    if (view.truncated) {
        if (!out.empty()) out += " + ";
        out += format_order(view.order, x.prime());
    }
    if (out.empty()) out = "0";
    return out;
}

ParsedSeries parse_series(const std::string &text, long prime) {
    if (!is_prime(prime))
        throw InvalidPrime("p must be prime, got " + std::to_string(prime));

    std::string s = strip_spaces(text);
    if (s.empty()) throw InvalidInput("series text is empty");

    ParsedSeries result;
    std::map<long, long> terms;

    std::vector<std::string> parts = split_terms(s);
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string &part = parts[i];
        if (is_order_term(part)) {
            if (i + 1 != parts.size()) bad_term(part, "the O-term must come last");
            result.order = parse_order(part, prime);
            continue;
        }
        Term t = parse_term(part, prime);
        if (!terms.emplace(t.exponent, t.digit).second)
            bad_term(part, "exponent " + std::to_string(t.exponent) + " appears twice");
    }

    // drop zero digits; what is left fixes valuation and length
    for (auto it = terms.begin(); it != terms.end();) {
        if (it->second == 0) it = terms.erase(it);
        else ++it;
    }
    if (terms.empty()) return result;

    const long low  = terms.begin()->first;
    const long high = terms.rbegin()->first;
    if (result.order && high >= *result.order)
        throw InvalidInput("term with exponent " + std::to_string(high) +
                           " is not below O-term order " + std::to_string(*result.order));
    const long top = result.order ? *result.order : high;
    if (top - low >= MAX_PARSED_SPAN)
        throw InvalidInput("series spans too many exponents: " + std::to_string(low) +
                           " to " + std::to_string(top));

    result.valuation = low;
    result.digits.assign(static_cast<size_t>(high - low + 1), 0);
    for (const auto &[exponent, digit] : terms)
        result.digits[static_cast<size_t>(exponent - low)] = digit;
    return result;
}

PAdicNumber parse_padic(const std::string &text, long prime, std::optional<long> precision) {
    ParsedSeries s = parse_series(text, prime);
    if (s.digits.empty() && s.order)
        return PAdicNumber::approximate_zero(prime, *s.order,
                                             precision.value_or(DEFAULT_PRECISION));

    long p = DEFAULT_PRECISION;
    if (s.order) {
        // every term lies below the order, so this is positive
        p = *s.order - s.valuation;
        if (precision) p = std::min(p, *precision);
    } else if (precision) {
        p = *precision;
    } else {
        p = std::max(DEFAULT_PRECISION, static_cast<long>(s.digits.size()));
    }

    return PAdicNumber::from_digits(prime, s.valuation, s.digits, p, !s.order.has_value());
}

bool validate_series(const std::string &text, long prime) {
    try {
        parse_series(text, prime);
        return true;
    } catch (const PadicError &) {
        return false;
    }
}

std::ostream &operator<<(std::ostream &out, const PAdicNumber &x) {
    return out << to_series_string(x);
}

} // namespace padic
