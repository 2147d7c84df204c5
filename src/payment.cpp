#include "payment.hpp"
#include "errors.hpp"

namespace ledgercalc {

namespace {

const char* const RENEGOTIATED_REASON = "renegotiated";
const char* const RESCHEDULED_REASON = "rescheduled";

void require_payable(const Installment& installment, const PaymentEvent& event) {
    if (installment.is_terminal()) {
        throw TerminalStateViolation("installment " + installment.id.to_string() + " is " +
                                     installment_status_to_string(installment.status) +
                                     " and accepts no payments");
    }
    if (installment.status == InstallmentStatus::PartiallyPaid) {
        throw InvalidPaymentTarget("installment " + installment.id.to_string() +
                                   " is PARTIALLY_PAID; pay its residual instead");
    }
    if (event.installment_ref != installment.id) {
        throw InvalidPaymentTarget("payment references installment " +
                                   event.installment_ref.to_string() + " but was applied to " +
                                   installment.id.to_string());
    }
    if (!event.amount_paid.is_positive()) {
        throw NegativeAmount("payment amount must be positive, got " + event.amount_paid.to_string());
    }
}

} // namespace

PaymentOutcome pay(
    const Installment& installment,
    const PaymentEvent& event,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    require_payable(installment, event);

    PaymentOutcome outcome;
    outcome.accrual = accrue(installment, event.payment_date, policy, config, calendar);
    outcome.amount_due = amount_due(installment, outcome.accrual);
    outcome.updated = installment;
    outcome.updated.paid_date = event.payment_date;

    if (event.amount_paid >= outcome.amount_due) {
        outcome.updated.status = InstallmentStatus::Paid;
        outcome.updated.paid_amount = outcome.amount_due;
        outcome.change = event.amount_paid - outcome.amount_due;
        return outcome;
    }

    outcome.updated.status = InstallmentStatus::PartiallyPaid;
    outcome.updated.paid_amount = event.amount_paid;

    Installment residual(installment.id.next_split(),
                         outcome.amount_due - event.amount_paid,
                         installment.due_date);
    residual.parent = installment.id;
    residual.penalty_charged = installment.penalty_charged || !outcome.accrual.penalty.is_zero();
    residual.accrued_through = installment.accrued_through;
    // Only a payment past the grace window, or one that took a discount, has
    // folded charges into the residual amount
    const bool charges_folded = outcome.accrual.days_late > policy.tolerance_days() ||
                                !outcome.accrual.discount.is_zero();
    if (charges_folded &&
        (!residual.accrued_through || *residual.accrued_through < event.payment_date)) {
        residual.accrued_through = event.payment_date;
    }
    outcome.residual = residual;
    return outcome;
}

Installment cancel(const Installment& installment, const std::string& reason) {
    if (installment.is_terminal()) {
        throw TerminalStateViolation("installment " + installment.id.to_string() + " is " +
                                     installment_status_to_string(installment.status) +
                                     " and cannot be cancelled");
    }
    Installment cancelled = installment;
    cancelled.status = InstallmentStatus::Cancelled;
    cancelled.cancel_reason = reason;
    return cancelled;
}

InstallmentStatus effective_status(
    const Installment& installment,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    if (installment.status != InstallmentStatus::Pending) {
        return installment.status;
    }
    const int64_t days_late = count_days_late(installment.due_date, as_of, config, calendar);
    return days_late > policy.tolerance_days() ? InstallmentStatus::Overdue : installment.status;
}

RenegotiationResult renegotiate(
    const std::vector<Installment>& installments,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const RenegotiationTerms& terms,
    const HolidayCalendar* calendar
) {
    if (terms.charges_discount < 0 || terms.charges_discount > 1) {
        throw InvalidPolicy("renegotiation discount must be within [0, 1], got " +
                            terms.charges_discount.str());
    }

    std::vector<Installment> cancelled;
    Money principal;
    Money charges;
    for (const auto& installment : installments) {
        if (!installment.is_open()) {
            continue;
        }
        // Early-payment discounts do not apply to renegotiated debt
        const AccrualResult accrual = accrue(installment, as_of, policy, config, calendar);
        principal += installment.amount;
        charges += accrual.penalty + accrual.interest;
        cancelled.push_back(cancel(installment, RENEGOTIATED_REASON));
    }

    if (cancelled.empty()) {
        throw InvalidPaymentTarget("no open installments to renegotiate");
    }

    const Money waived = Money::from_decimal(charges.to_decimal() * terms.charges_discount,
                                             config.rounding_mode);
    const Money total = principal + charges - waived;

    return RenegotiationResult{
        std::move(cancelled),
        principal,
        charges,
        waived,
        total,
        create_plan(total, terms.installment_count, terms.first_due, terms.periodicity, config, calendar)
    };
}

RescheduleResult reschedule(
    const std::vector<Installment>& installments,
    const RescheduleTerms& terms,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    if (terms.days_shift < 1) {
        throw InvalidDateRange("reschedule must move due dates forward, got " +
                               std::to_string(terms.days_shift) + " days");
    }
    if (terms.fee_rate < 0) {
        throw InvalidPolicy("reschedule fee rate cannot be negative, got " + terms.fee_rate.str());
    }

    RescheduleResult result;
    for (const auto& installment : installments) {
        if (!installment.is_open()) {
            continue;
        }
        const Money fee = Money::from_decimal(installment.amount.to_decimal() * terms.fee_rate,
                                              config.rounding_mode);
        const Date due = adjust_due_date(add_days(installment.due_date, terms.days_shift), config, calendar);

        Installment replacement(installment.id.next_split(), installment.amount + fee, due);
        replacement.parent = installment.id;
        replacement.penalty_charged = installment.penalty_charged;
        replacement.accrued_through = installment.accrued_through;

        result.cancelled.push_back(cancel(installment, RESCHEDULED_REASON));
        result.rescheduled.push_back(replacement);
        result.total_fees += fee;
    }

    if (result.rescheduled.empty()) {
        throw InvalidPaymentTarget("no open installments to reschedule");
    }
    return result;
}

} // namespace ledgercalc
