#include "portfolio.hpp"
#include "errors.hpp"
#include "payment.hpp"
#include <exception>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace ledgercalc {

std::vector<AccrualResult> accrue_all(
    const std::vector<Installment>& installments,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    const int64_t count = static_cast<int64_t>(installments.size());
    std::vector<AccrualResult> results(installments.size());
    std::vector<std::exception_ptr> failures(installments.size());

    // Each iteration writes only its own slot; failures are collected per slot
    // and the earliest one is rethrown after the loop
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 64)
#endif
    for (int64_t i = 0; i < count; ++i) {
        const size_t index = static_cast<size_t>(i);
        try {
            results[index] = accrue(installments[index], as_of, policy, config, calendar);
        } catch (...) {
            failures[index] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return results;
}

// ============================================================================
// Aging
// ============================================================================

AgingBucket::AgingBucket(int64_t min, std::optional<int64_t> max)
    : min_days(min),
      max_days(max),
      count(0) {}

bool AgingBucket::contains(int64_t days_late) const {
    return days_late >= min_days && (!max_days || days_late <= *max_days);
}

std::string AgingBucket::label() const {
    if (!max_days) {
        return std::to_string(min_days) + "+";
    }
    return std::to_string(min_days) + "-" + std::to_string(*max_days);
}

std::vector<AgingBucket> default_aging_buckets() {
    return {
        AgingBucket(1, 30),
        AgingBucket(31, 60),
        AgingBucket(61, 90),
        AgingBucket(91, std::nullopt)
    };
}

namespace {

void validate_buckets(const std::vector<AgingBucket>& buckets) {
    for (size_t i = 0; i < buckets.size(); ++i) {
        const AgingBucket& bucket = buckets[i];
        if (bucket.min_days < 1 || (bucket.max_days && *bucket.max_days < bucket.min_days)) {
            throw InvalidConfiguration("aging bucket " + bucket.label() + " is not a valid days-late range");
        }
        if (i > 0) {
            const AgingBucket& previous = buckets[i - 1];
            if (!previous.max_days || *previous.max_days >= bucket.min_days) {
                throw InvalidConfiguration("aging buckets " + previous.label() + " and " +
                                           bucket.label() + " overlap or are unsorted");
            }
        }
    }
}

} // namespace

AgingReport aging_report(
    const std::vector<Installment>& installments,
    const Date& as_of,
    const InterestPolicy& policy,
    const EngineConfig& config,
    std::vector<AgingBucket> buckets,
    const HolidayCalendar* calendar
) {
    validate_buckets(buckets);

    AgingReport report;
    report.buckets = std::move(buckets);
    for (auto& bucket : report.buckets) {
        bucket.amount = Money::zero();
        bucket.count = 0;
    }

    for (const auto& installment : installments) {
        switch (installment.status) {
            case InstallmentStatus::Cancelled:
                continue;
            case InstallmentStatus::PartiallyPaid:
                report.total_tracked += installment.paid_amount;
                continue;
            case InstallmentStatus::Paid:
                report.total_tracked += installment.amount;
                continue;
            case InstallmentStatus::Pending:
            case InstallmentStatus::Overdue:
                break;
        }

        report.total_tracked += installment.amount;
        report.total_open += installment.amount;

        const int64_t days_late = count_days_late(installment.due_date, as_of, config, calendar);
        if (days_late <= 0 ||
            effective_status(installment, as_of, policy, config, calendar) != InstallmentStatus::Overdue) {
            continue;
        }
        report.total_overdue += installment.amount;
        for (auto& bucket : report.buckets) {
            if (bucket.contains(days_late)) {
                bucket.amount += installment.amount;
                ++bucket.count;
                break;
            }
        }
    }

    report.delinquency_rate = report.total_tracked.is_zero()
        ? Decimal(0)
        : report.total_overdue.to_decimal() / report.total_tracked.to_decimal();
    return report;
}

Decimal weighted_average_days(const std::vector<WeightedDaysSample>& samples) {
    Decimal weighted_sum = 0;
    Money total;
    for (const auto& sample : samples) {
        if (sample.amount.is_negative()) {
            throw NegativeAmount("weighted sample amount " + sample.amount.to_string());
        }
        weighted_sum += sample.amount.to_decimal() * sample.days;
        total += sample.amount;
    }
    if (total.is_zero()) {
        return Decimal(0);
    }
    return weighted_sum / total.to_decimal();
}

} // namespace ledgercalc
