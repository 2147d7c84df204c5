#include "errors.hpp"

namespace ledgercalc {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInstallmentCount: return "InvalidInstallmentCount";
        case ErrorKind::InvalidDateRange: return "InvalidDateRange";
        case ErrorKind::TerminalStateViolation: return "TerminalStateViolation";
        case ErrorKind::UnsupportedCalendarYear: return "UnsupportedCalendarYear";
        case ErrorKind::NegativeAmount: return "NegativeAmount";
        case ErrorKind::PolicyTierGap: return "PolicyTierGap";
        case ErrorKind::InvalidPolicy: return "InvalidPolicy";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::InvalidAllocation: return "InvalidAllocation";
        case ErrorKind::InvalidPaymentTarget: return "InvalidPaymentTarget";
        default: return "Unknown";
    }
}

} // namespace ledgercalc
