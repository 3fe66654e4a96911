#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "padic_number.hpp"

// Front-end logic shared by the interactive screen and the batch mode of
// padic_calc.  Everything here throws the library's exceptions unchanged.

namespace calculator {

struct Settings {
    long prime       = 5;
    long precision   = padic::DEFAULT_PRECISION;
    long show_digits = padic::DEFAULT_SHOW_DIGITS;
    int  debug_level = 0;
};

enum class Operation { Convert, Add, Subtract, Multiply, Divide, Compare };

const std::vector<std::string> &operation_names();

// "convert", "add", "subtract", "multiply", "divide", "compare" (any case).
// Throws padic::InvalidInput for anything else.
Operation operation_from_name(const std::string &name);

using Row = std::pair<std::string, std::string>;

// Numeric field limits of the interactive screen, which re-evaluates on every
// redraw.  Nine digits keep is_prime under ~16k trial divisions.
constexpr std::size_t PRIME_FIELD_DIGITS     = 9;
constexpr std::size_t PRECISION_FIELD_DIGITS = 4;
constexpr std::size_t SHOW_FIELD_DIGITS      = 3;
constexpr long        MAX_INTERACTIVE_PRIME  = 999999999;

// Whether typing c into a numeric field holding value keeps it at most
// max_len decimal digits.
bool field_accepts(const std::string &value, char c, std::size_t max_len);

// Rational or integer text ("-3/7", "42"), or series text when it contains
// '+', '*', '^' or an O-term ("1/5 + 2 + 3*5 + O(5^3)").
padic::PAdicNumber parse_operand(const std::string &text, const Settings &settings);

// Label/value rows: series, valuation, digits, cycle, exactness, rational,
// and the integer value when there is one.
std::vector<Row> describe(const padic::PAdicNumber &x, long show_digits);

// Parses the operands and applies op.  b is ignored for Convert.
std::vector<Row> evaluate(Operation op, const std::string &a, const std::string &b,
                          const Settings &settings);

} // namespace calculator
