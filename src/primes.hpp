#pragma once

namespace padic {

// Trial-division primality test up to isqrt(n).  Values below 2 are not prime.
bool is_prime(long n);

} // namespace padic
