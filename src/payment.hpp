#ifndef LEDGERCALC_PAYMENT_HPP
#define LEDGERCALC_PAYMENT_HPP

#include <optional>
#include <string>
#include <vector>
#include "accrual.hpp"
#include "amortization.hpp"
#include "calendar.hpp"
#include "engine_config.hpp"
#include "installment.hpp"
#include "interest_policy.hpp"

namespace ledgercalc {

struct PaymentEvent {
    InstallmentId installment_ref;
    Money amount_paid;
    Date payment_date;
};

struct PaymentOutcome {
    Installment updated;
    std::optional<Installment> residual;
    AccrualResult accrual;
    Money amount_due;
    Money change;           // amount paid beyond amount_due
};

// Apply a payment event to an installment.
//
// PAID or CANCELLED installments raise TerminalStateViolation. A
// PARTIALLY_PAID installment, or an event referencing another installment,
// raises InvalidPaymentTarget; the open remainder of a partial payment lives
// on its residual. A non-positive amount raises NegativeAmount.
//
// Full payment marks the installment PAID with paid_amount = amount_due.
// Partial payment marks it PARTIALLY_PAID and emits a PENDING residual for
// amount_due - amount_paid with the same due date and id parent.next_split().
// If the payment fell past the grace window or took a discount, those charges
// are folded into the residual and its accrued_through is the payment date.
PaymentOutcome pay(
    const Installment& installment,
    const PaymentEvent& event,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

// Mark an installment CANCELLED with the given reason.
// Throws TerminalStateViolation if it is already PAID or CANCELLED.
Installment cancel(const Installment& installment, const std::string& reason);

// Stored status, except PENDING past the tolerance window reads as OVERDUE
InstallmentStatus effective_status(
    const Installment& installment,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

struct RenegotiationTerms {
    Decimal charges_discount;       // fraction of accrued charges waived, in [0, 1]
    int installment_count;
    Date first_due;
    Periodicity periodicity;
};

struct RenegotiationResult {
    std::vector<Installment> cancelled;     // originals, now CANCELLED
    Money original_principal;
    Money accrued_charges;                  // before the discount
    Money waived;
    Money renegotiated_total;
    AmortizationPlan plan;
};

// Consolidate every open installment into a new plan. Accrued charges (not
// principal) are reduced by terms.charges_discount, originals are cancelled
// with reason "renegotiated" and the total is split per terms.
// Throws InvalidPaymentTarget if no installment is open, InvalidPolicy if the
// discount is outside [0, 1], plus anything split() raises.
RenegotiationResult renegotiate(
    const std::vector<Installment>& installments,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const RenegotiationTerms& terms,
    const HolidayCalendar* calendar = nullptr
);

struct RescheduleTerms {
    int64_t days_shift;     // added to every due date, >= 1
    Decimal fee_rate;       // per-installment fee as a fraction of its amount
};

struct RescheduleResult {
    std::vector<Installment> cancelled;     // originals, now CANCELLED
    std::vector<Installment> rescheduled;   // replacements, in input order
    Money total_fees;
};

// Push every open installment's due date out by terms.days_shift days and add
// a fee of amount * fee_rate. Each original is cancelled with reason
// "rescheduled" and replaced by a PENDING installment with id
// original.next_split(), parent = original, amount + fee and the shifted due
// date (then adjusted per config.due_date_adjustment). Non-open installments
// are skipped.
// Throws InvalidDateRange if days_shift < 1, InvalidPolicy for a negative fee
// rate, InvalidPaymentTarget if nothing is open, InvalidConfiguration if an
// adjustment is configured without a calendar.
RescheduleResult reschedule(
    const std::vector<Installment>& installments,
    const RescheduleTerms& terms,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

} // namespace ledgercalc

#endif // LEDGERCALC_PAYMENT_HPP
