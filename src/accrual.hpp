#ifndef LEDGERCALC_ACCRUAL_HPP
#define LEDGERCALC_ACCRUAL_HPP

#include <cstdint>
#include "calendar.hpp"
#include "engine_config.hpp"
#include "installment.hpp"
#include "interest_policy.hpp"
#include "money.hpp"

namespace ledgercalc {

// Charges owed on an installment at a given date. Monetary fields are rounded
// once, at the end of the computation.
struct AccrualResult {
    Money penalty;
    Money interest;
    Money discount;
    int64_t days_late;          // 0 when not late
    int64_t days_early;         // 0 when not early
    int64_t billable_days;      // days actually charged interest

    AccrualResult();

    bool has_charges() const { return !penalty.is_zero() || !interest.is_zero(); }

    // penalty + interest - discount
    Money net_charges() const;
};

// Compute penalty, interest and early-payment discount as of `as_of`.
//
// On or before the due date only the early-payment discount applies
// (amount * rate * days_early, capped at amount). Residuals carrying
// accrued_through get no further discount.
//
// After the due date nothing accrues while days_late <= tolerance_days. Beyond
// it, the one-time penalty applies (unless the installment already carries it)
// and interest is charged on the billable days:
//   - FULL_DAYS_LATE: every late day; DAYS_BEYOND_TOLERANCE: days after the
//     tolerance window
//   - days on or before installment.accrued_through are never billed again
//   - WHOLE_PERIOD bills every day at the tier for days_late; GRADUATED bills
//     each day at the tier covering its own index
//   - a rate change replaces the tier rate for days dated after it
// Simple interest sums amount * rate * days per run of equal rates; compound
// carries the grown value from one run to the next.
//
// `calendar` is required when config.late_day_counting is BUSINESS_DAYS.
// Throws PolicyTierGap if a billed day has no covering tier,
// InvalidConfiguration if a required calendar is missing.
AccrualResult accrue(
    const Installment& installment,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

// installment.amount + penalty + interest - discount
Money amount_due(const Installment& installment, const AccrualResult& accrual);

// Receivable anticipation: an amount collected before its due date is
// discounted by monthly_rate prorated over 30-day months.
struct AnticipationResult {
    int64_t days_early;
    Decimal proportional_rate;  // monthly_rate * days_early / 30
    Money discount;             // capped at the amount
    Money net_amount;           // amount - discount
};

// Nothing is discounted on or after the due date.
// Throws NegativeAmount for a negative amount, InvalidPolicy for a negative rate.
AnticipationResult anticipate(
    Money amount,
    const Date& due_date,
    const Date& anticipation_date,
    const Decimal& monthly_rate,
    RoundingMode mode
);

// (1 + rate)^days by repeated squaring; exact for decimal rates
Decimal compound_factor(const Decimal& daily_rate, int64_t days);

// Days late as counted under config.late_day_counting (0 if not late)
int64_t count_days_late(
    const Date& due_date,
    const Date& as_of,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

} // namespace ledgercalc

#endif // LEDGERCALC_ACCRUAL_HPP
