#ifndef LEDGERCALC_ERRORS_HPP
#define LEDGERCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ledgercalc {

enum class ErrorKind {
    InvalidInstallmentCount,
    InvalidDateRange,
    TerminalStateViolation,
    UnsupportedCalendarYear,
    NegativeAmount,
    PolicyTierGap,
    InvalidPolicy,
    InvalidConfiguration,
    InvalidAllocation,
    InvalidPaymentTarget
};

const char* error_kind_to_string(ErrorKind kind);

// Base class for every failure raised by the engine.
// All failures are local and synchronous; nothing is retried internally.
class LedgerCalcError : public std::runtime_error {
public:
    LedgerCalcError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInstallmentCount : public LedgerCalcError {
public:
    explicit InvalidInstallmentCount(const std::string& message)
        : LedgerCalcError(ErrorKind::InvalidInstallmentCount, "Invalid installment count: " + message) {}
};

class InvalidDateRange : public LedgerCalcError {
public:
    explicit InvalidDateRange(const std::string& message)
        : LedgerCalcError(ErrorKind::InvalidDateRange, "Invalid date range: " + message) {}
};

class TerminalStateViolation : public LedgerCalcError {
public:
    explicit TerminalStateViolation(const std::string& message)
        : LedgerCalcError(ErrorKind::TerminalStateViolation, "Terminal state violation: " + message) {}
};

class UnsupportedCalendarYear : public LedgerCalcError {
public:
    explicit UnsupportedCalendarYear(const std::string& message)
        : LedgerCalcError(ErrorKind::UnsupportedCalendarYear, "Unsupported calendar year: " + message) {}
};

class NegativeAmount : public LedgerCalcError {
public:
    explicit NegativeAmount(const std::string& message)
        : LedgerCalcError(ErrorKind::NegativeAmount, "Negative amount: " + message) {}
};

// Raised when no tier covers the days late being billed. A misconfigured
// policy must never silently produce zero interest.
class PolicyTierGap : public LedgerCalcError {
public:
    explicit PolicyTierGap(const std::string& message)
        : LedgerCalcError(ErrorKind::PolicyTierGap, "Policy tier gap: " + message) {}
};

class InvalidPolicy : public LedgerCalcError {
public:
    explicit InvalidPolicy(const std::string& message)
        : LedgerCalcError(ErrorKind::InvalidPolicy, "Invalid interest policy: " + message) {}
};

class InvalidConfiguration : public LedgerCalcError {
public:
    explicit InvalidConfiguration(const std::string& message)
        : LedgerCalcError(ErrorKind::InvalidConfiguration, "Invalid configuration: " + message) {}
};

class InvalidAllocation : public LedgerCalcError {
public:
    explicit InvalidAllocation(const std::string& message)
        : LedgerCalcError(ErrorKind::InvalidAllocation, "Invalid allocation: " + message) {}
};

class InvalidPaymentTarget : public LedgerCalcError {
public:
    explicit InvalidPaymentTarget(const std::string& message)
        : LedgerCalcError(ErrorKind::InvalidPaymentTarget, "Invalid payment target: " + message) {}
};

} // namespace ledgercalc

#endif // LEDGERCALC_ERRORS_HPP
