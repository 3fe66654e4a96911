#include "primes.hpp"

namespace padic {

bool is_prime(long n) {
    // 0, 1 and negatives are not prime
    if (n < 2) return false;
    // 2 and 3 are prime
    if (n < 4) return true;
    // even numbers
    if (n % 2 == 0) return false;

    // odd divisors from 3 up to sqrt(n); i <= n / i avoids overflowing i * i
    for (long i = 3; i <= n / i; i += 2) {
        if (n % i == 0) return false;
    }
    return true;
}

} // namespace padic
