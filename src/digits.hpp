#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "rational.hpp"

namespace padic {

// Repeating tail of an eventually periodic expansion: digits[start + k]
// equals digits[start + k % length] for every k >= 0.
struct Cycle {
    std::size_t start  = 0;
    std::size_t length = 0;
};

inline bool operator==(const Cycle &a, const Cycle &b) {
    return a.start == b.start && a.length == b.length;
}
inline bool operator!=(const Cycle &a, const Cycle &b) { return !(a == b); }

struct Expansion {
    std::vector<long>    digits;  // little-endian, each in [0, p)
    std::optional<Cycle> cycle;   // set when the state repeated within budget
};

// Base-p long division of num/den (both coprime to p) into exactly n digits.
//
// The remaining value is kept as state/den; den never changes.  Each step
// takes a = state * den^-1 mod p and moves to (state - a*den) / p, which is
// exact.  States are remembered, so a repeat inside the budget yields the
// cycle, and the digits past it are filled by repetition.  A terminating
// expansion shows up as a cycle of zeros (state 0 maps to itself).
//
// Throws InvalidInput if p < 2, den == 0 or den is divisible by p.
Expansion expand_digits(const Integer &num, const Integer &den, long p, std::size_t n);

} // namespace padic
