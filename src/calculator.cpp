#include "calculator.hpp"
#include "errors.hpp"
#include "series.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

using padic::PAdicNumber;

namespace calculator {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static bool looks_like_series(const std::string &text) {
    return text.find_first_of("+*^O") != std::string::npos;
}

static std::string join_digits(const std::vector<long> &digits) {
    std::string out;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(digits[i]);
    }
    return "[" + out + "]";
}

const std::vector<std::string> &operation_names() {
    static const std::vector<std::string> NAMES = {
        "Convert", "Add", "Subtract", "Multiply", "Divide", "Compare",
    };
    return NAMES;
}

Operation operation_from_name(const std::string &name) {
    static const Operation OPS[] = {
        Operation::Convert, Operation::Add,    Operation::Subtract,
        Operation::Multiply, Operation::Divide, Operation::Compare,
    };
    const std::string wanted = to_lower(name);
    const auto &names = operation_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (to_lower(names[i]) == wanted) return OPS[i];
    }
    throw padic::InvalidInput("unknown operation \"" + name + "\"");
}

bool field_accepts(const std::string &value, char c, std::size_t max_len) {
    return std::isdigit(static_cast<unsigned char>(c)) && value.size() < max_len;
}

PAdicNumber parse_operand(const std::string &text, const Settings &settings) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        throw padic::InvalidInput("operand is empty");

    if (looks_like_series(text)) {
        // an O-term carries its own precision
        if (text.find('O') != std::string::npos)
            return padic::parse_padic(text, settings.prime);
        return padic::parse_padic(text, settings.prime, settings.precision);
    }
    return PAdicNumber(padic::Rational(text), settings.prime, settings.precision);
}

std::vector<Row> describe(const PAdicNumber &x, long show_digits) {
    std::vector<Row> rows;
    rows.emplace_back("Series", padic::to_series_string(x, show_digits));
    const std::optional<long> order = x.order();
    const std::string known_mod = order ? "no, known mod " + std::to_string(x.prime()) +
                                              "^" + std::to_string(*order)
                                        : "yes";
    if (x.is_zero()) {
        // O(p^k) only bounds the valuation
        rows.emplace_back("Valuation", order ? ">= " + std::to_string(*order) : "+inf");
        if (order) rows.emplace_back("Exact", known_mod);
        rows.emplace_back("Rational", "0");
        return rows;
    }

    rows.emplace_back("Valuation", std::to_string(x.valuation()));
    rows.emplace_back("Digits", join_digits(x.digits()));
    if (x.cycle()) {
        rows.emplace_back("Cycle", "starts at digit " + std::to_string(x.cycle()->start) +
                                   ", period " + std::to_string(x.cycle()->length));
    } else {
        rows.emplace_back("Cycle", "none");
    }
    rows.emplace_back("Exact", known_mod);

    padic::Rational value = x.to_rational();
    rows.emplace_back("Rational", value.to_string());
    if (x.valuation() >= 0 && value.is_integer())
        rows.emplace_back("Integer", value.numerator().to_string());
    return rows;
}

std::vector<Row> evaluate(Operation op, const std::string &a, const std::string &b,
                          const Settings &settings) {
    PAdicNumber x = parse_operand(a, settings);
    if (op == Operation::Convert) return describe(x, settings.show_digits);

    PAdicNumber y = parse_operand(b, settings);
    std::vector<Row> rows;
    rows.emplace_back("A", padic::to_series_string(x, settings.show_digits));
    rows.emplace_back("B", padic::to_series_string(y, settings.show_digits));

    if (op == Operation::Compare) {
        rows.emplace_back("Equal (to shared precision)", x.equals(y) ? "yes" : "no");
        rows.emplace_back("Equal as rationals",
                          x.to_rational() == y.to_rational() ? "yes" : "no");
        return rows;
    }

    PAdicNumber result = x;
    switch (op) {
    case Operation::Add:      result = x + y; break;
    case Operation::Subtract: result = x - y; break;
    case Operation::Multiply: result = x * y; break;
    case Operation::Divide:   result = x / y; break;
    default: break;
    }

    for (Row &row : describe(result, settings.show_digits))
        rows.push_back(std::move(row));
    return rows;
}

} // namespace calculator
