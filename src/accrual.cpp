#include "accrual.hpp"
#include "errors.hpp"
#include <vector>

namespace ledgercalc {

// ============================================================================
// AccrualResult Implementation
// ============================================================================

AccrualResult::AccrualResult()
    : days_late(0),
      days_early(0),
      billable_days(0) {}

Money AccrualResult::net_charges() const {
    return penalty + interest - discount;
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

const int DAYS_PER_MONTH = 30;

void require_calendar(const EngineConfig& config, const HolidayCalendar* calendar) {
    if (config.late_day_counting == LateDayCounting::BusinessDays && calendar == nullptr) {
        throw InvalidConfiguration("late day counting BUSINESS_DAYS requires a holiday calendar");
    }
}

// Dates of each late day in order; the k-th element is late day k + 1
std::vector<Date> late_days(const Date& due_date, const Date& as_of,
                            const EngineConfig& config, const HolidayCalendar* calendar) {
    std::vector<Date> days;
    for (Date day = add_days(due_date, 1); day <= as_of; day = add_days(day, 1)) {
        if (config.late_day_counting == LateDayCounting::CalendarDays ||
            calendar->is_business_day(day)) {
            days.push_back(day);
        }
    }
    return days;
}

// Consecutive billed days sharing a rate
struct RateRun {
    Decimal rate;
    int64_t days;
};

std::vector<RateRun> billed_runs(const std::vector<Date>& days,
                                 int64_t first_billed_index,
                                 const Installment& installment,
                                 const InterestPolicy& policy,
                                 const EngineConfig& config) {
    const int64_t days_late = static_cast<int64_t>(days.size());
    std::vector<RateRun> runs;

    for (int64_t index = first_billed_index; index < days_late; ++index) {
        const Date& day = days[static_cast<size_t>(index)];
        if (installment.accrued_through && day <= *installment.accrued_through) {
            continue;
        }

        const int64_t tier_days = config.tier_application == TierApplication::Graduated
            ? index + 1
            : days_late;
        const Decimal& rate = policy.rate_on(day, policy.tier_for(tier_days).daily_rate);

        if (!runs.empty() && runs.back().rate == rate) {
            ++runs.back().days;
        } else {
            runs.push_back(RateRun{rate, 1});
        }
    }
    return runs;
}

} // namespace

// ============================================================================
// Accrual
// ============================================================================

Decimal compound_factor(const Decimal& daily_rate, int64_t days) {
    Decimal result = 1;
    Decimal base = Decimal(1) + daily_rate;
    while (days > 0) {
        if (days & 1) {
            result *= base;
        }
        base *= base;
        days >>= 1;
    }
    return result;
}

int64_t count_days_late(const Date& due_date, const Date& as_of,
                        const EngineConfig& config, const HolidayCalendar* calendar) {
    if (as_of <= due_date) {
        return 0;
    }
    require_calendar(config, calendar);
    if (config.late_day_counting == LateDayCounting::CalendarDays) {
        return days_between(due_date, as_of);
    }
    return calendar->business_days_between(add_days(due_date, 1), as_of);
}

AccrualResult accrue(
    const Installment& installment,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    require_calendar(config, calendar);

    AccrualResult result;
    const Decimal amount = installment.amount.to_decimal();

    if (as_of <= installment.due_date) {
        result.days_early = days_between(as_of, installment.due_date);
        // A residual already had the discount folded in by the partial payment
        const auto& discount_rate = policy.early_payment_discount_rate();
        if (discount_rate && result.days_early > 0 && !installment.accrued_through) {
            Money discount = Money::from_decimal(amount * *discount_rate * result.days_early,
                                                 config.rounding_mode);
            if (discount > installment.amount) {
                discount = installment.amount;
            }
            result.discount = discount;
        }
        return result;
    }

    const std::vector<Date> days = late_days(installment.due_date, as_of, config, calendar);
    result.days_late = static_cast<int64_t>(days.size());

    // Grace period
    if (result.days_late <= policy.tolerance_days()) {
        return result;
    }

    if (policy.penalty_percent() && !installment.penalty_charged) {
        result.penalty = Money::from_decimal(amount * *policy.penalty_percent(), config.rounding_mode);
    }

    const int64_t first_billed_index =
        config.billable_days_convention == BillableDaysConvention::DaysBeyondTolerance
            ? policy.tolerance_days()
            : 0;
    const std::vector<RateRun> runs = billed_runs(days, first_billed_index, installment, policy, config);

    Decimal interest = 0;
    Decimal value = amount;
    for (const auto& run : runs) {
        result.billable_days += run.days;
        if (policy.model() == AccrualModel::Simple) {
            interest += amount * run.rate * run.days;
        } else {
            value *= compound_factor(run.rate, run.days);
        }
    }
    if (policy.model() == AccrualModel::Compound) {
        interest = value - amount;
    }

    result.interest = Money::from_decimal(interest, config.rounding_mode);
    return result;
}

Money amount_due(const Installment& installment, const AccrualResult& accrual) {
    return installment.amount + accrual.net_charges();
}

AnticipationResult anticipate(
    Money amount,
    const Date& due_date,
    const Date& anticipation_date,
    const Decimal& monthly_rate,
    RoundingMode mode
) {
    if (amount.is_negative()) {
        throw NegativeAmount("anticipated amount " + amount.to_string());
    }
    if (monthly_rate < 0) {
        throw InvalidPolicy("anticipation rate cannot be negative, got " + monthly_rate.str());
    }

    AnticipationResult result;
    result.days_early = anticipation_date < due_date ? days_between(anticipation_date, due_date) : 0;
    result.proportional_rate = monthly_rate * result.days_early / DAYS_PER_MONTH;
    result.discount = Money::from_decimal(amount.to_decimal() * result.proportional_rate, mode);
    if (result.discount > amount) {
        result.discount = amount;
    }
    result.net_amount = amount - result.discount;
    return result;
}

} // namespace ledgercalc
