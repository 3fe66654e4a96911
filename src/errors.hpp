#pragma once
#include <stdexcept>
#include <string>

namespace padic {

enum class ErrorKind {
    InvalidPrime,
    InvalidPrecision,
    InvalidInput,
    PrimeMismatch,
    NotAnInteger,
    PrecisionExceeded,
};

inline const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::InvalidPrime:      return "InvalidPrime";
    case ErrorKind::InvalidPrecision:  return "InvalidPrecision";
    case ErrorKind::InvalidInput:      return "InvalidInput";
    case ErrorKind::PrimeMismatch:     return "PrimeMismatch";
    case ErrorKind::NotAnInteger:      return "NotAnInteger";
    case ErrorKind::PrecisionExceeded: return "PrecisionExceeded";
    }
    return "Unknown";
}

// Base of every error thrown by the library.  Callers that only need the
// message can keep catching std::invalid_argument / std::exception.
class PadicError : public std::invalid_argument {
public:
    PadicError(ErrorKind kind, const std::string &what)
        : std::invalid_argument(what), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

// prime parameter failed is_prime()
class InvalidPrime : public PadicError {
public:
    explicit InvalidPrime(const std::string &what)
        : PadicError(ErrorKind::InvalidPrime, what) {}
};

// precision <= 0
class InvalidPrecision : public PadicError {
public:
    explicit InvalidPrecision(const std::string &what)
        : PadicError(ErrorKind::InvalidPrecision, what) {}
};

// zero denominator, unparseable text, denominator not coprime to p, ...
class InvalidInput : public PadicError {
public:
    explicit InvalidInput(const std::string &what)
        : PadicError(ErrorKind::InvalidInput, what) {}
};

// arithmetic between numbers over different primes
class PrimeMismatch : public PadicError {
public:
    explicit PrimeMismatch(const std::string &what)
        : PadicError(ErrorKind::PrimeMismatch, what) {}
};

class NotAnInteger : public PadicError {
public:
    explicit NotAnInteger(const std::string &what)
        : PadicError(ErrorKind::NotAnInteger, what) {}
};

// to_rational() asked for a denominator bound tighter than p^(-valuation)
class PrecisionExceeded : public PadicError {
public:
    explicit PrecisionExceeded(const std::string &what)
        : PadicError(ErrorKind::PrecisionExceeded, what) {}
};

} // namespace padic
