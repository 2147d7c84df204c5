#ifndef LEDGERCALC_PORTFOLIO_HPP
#define LEDGERCALC_PORTFOLIO_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "accrual.hpp"
#include "calendar.hpp"
#include "engine_config.hpp"
#include "installment.hpp"
#include "interest_policy.hpp"

namespace ledgercalc {

// Accrue every installment as of the same date. Runs in parallel when built
// with OpenMP. Results are in input order; if any accrual fails the first
// failing installment's exception (in input order) is rethrown.
std::vector<AccrualResult> accrue_all(
    const std::vector<Installment>& installments,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar = nullptr
);

// Days-late range [min_days, max_days]; no max_days means open-ended
struct AgingBucket {
    int64_t min_days;
    std::optional<int64_t> max_days;
    Money amount;
    size_t count;

    AgingBucket(int64_t min, std::optional<int64_t> max);

    bool contains(int64_t days_late) const;
    std::string label() const;      // "1-30", "91+"
};

struct AgingReport {
    std::vector<AgingBucket> buckets;
    Money total_tracked;        // everything not cancelled, paid or open
    Money total_open;           // still owed
    Money total_overdue;        // still owed and past due
    Decimal delinquency_rate;   // total_overdue / total_tracked, 0 when nothing tracked
};

// 1-30, 31-60, 61-90, 91+
std::vector<AgingBucket> default_aging_buckets();

// Outstanding overdue amounts grouped by days late, counted under
// config.late_day_counting. An open installment is overdue when
// effective_status() says so, so one still inside the policy's tolerance
// window is open but not overdue. Cancelled installments are ignored; a
// partially paid installment contributes its paid part to the tracked total
// and its residual carries the rest.
// Throws InvalidConfiguration if the buckets overlap or are unsorted, or if
// BUSINESS_DAYS counting is configured without a calendar.
AgingReport aging_report(
    const std::vector<Installment>& installments,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    std::vector<AgingBucket> buckets = default_aging_buckets(),
    const HolidayCalendar* calendar = nullptr
);

struct WeightedDaysSample {
    Money amount;
    int64_t days;
};

// sum(amount * days) / sum(amount); 0 for an empty or zero-valued sample set.
// Throws NegativeAmount for negative amounts.
Decimal weighted_average_days(const std::vector<WeightedDaysSample>& samples);

} // namespace ledgercalc

#endif // LEDGERCALC_PORTFOLIO_HPP
