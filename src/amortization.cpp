#include "amortization.hpp"
#include "errors.hpp"

namespace ledgercalc {

// ============================================================================
// Periodicity Implementation
// ============================================================================

Periodicity Periodicity::days(int interval) {
    if (interval <= 0) {
        throw InvalidConfiguration("periodicity interval must be positive, got " +
                                   std::to_string(interval));
    }
    return Periodicity(Kind::EveryNDays, interval);
}

Periodicity Periodicity::monthly() {
    return Periodicity(Kind::Monthly, 0);
}

Periodicity Periodicity::end_of_month() {
    return Periodicity(Kind::EndOfMonth, 0);
}

Date Periodicity::due_date(const Date& first_due, int index) const {
    switch (kind_) {
        case Kind::EveryNDays:
            return add_days(first_due, static_cast<int64_t>(interval_days_) * index);
        case Kind::Monthly:
            return add_months_clamped(first_due, index, first_due.day());
        case Kind::EndOfMonth: {
            const Date month_start = add_months_clamped(first_of_month(first_due), index, 1);
            return ledgercalc::end_of_month(month_start.year(), month_start.month());
        }
    }
    return first_due;
}

std::string Periodicity::to_string() const {
    switch (kind_) {
        case Kind::EveryNDays: return "EVERY_" + std::to_string(interval_days_) + "_DAYS";
        case Kind::Monthly: return "MONTHLY";
        case Kind::EndOfMonth: return "END_OF_MONTH";
    }
    return "UNKNOWN";
}

// ============================================================================
// AmortizationPlan Implementation
// ============================================================================

AmortizationPlan::AmortizationPlan(Money total,
                                   Date first_due,
                                   Periodicity periodicity,
                                   std::vector<Installment> installments)
    : total_(total),
      first_due_(first_due),
      periodicity_(periodicity),
      installments_(std::move(installments)) {
    Money sum;
    for (const auto& installment : installments_) {
        sum += installment.amount;
    }
    if (sum != total_) {
        throw InvalidAllocation("installments sum to " + sum.to_string() +
                                " but plan total is " + total_.to_string());
    }
}

// ============================================================================
// Scheduling
// ============================================================================

Date adjust_due_date(const Date& date, const EngineConfig& config, const HolidayCalendar* calendar) {
    if (config.due_date_adjustment != DueDateAdjustment::None && calendar == nullptr) {
        throw InvalidConfiguration("due date adjustment " +
                                   due_date_adjustment_to_string(config.due_date_adjustment) +
                                   " requires a holiday calendar");
    }
    switch (config.due_date_adjustment) {
        case DueDateAdjustment::None:
            return date;
        case DueDateAdjustment::NextBusinessDay:
            return calendar->adjust(date, AdjustDirection::Next);
        case DueDateAdjustment::PreviousBusinessDay:
            return calendar->adjust(date, AdjustDirection::Previous);
    }
    return date;
}

std::vector<Installment> split(
    Money total,
    int n,
    const Date& first_due,
    const Periodicity& periodicity,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    if (n <= 0) {
        throw InvalidInstallmentCount("n must be >= 1, got " + std::to_string(n));
    }
    if (total.is_negative()) {
        throw NegativeAmount("total " + total.to_string() + " cannot be split");
    }
    if (config.due_date_adjustment != DueDateAdjustment::None && calendar == nullptr) {
        throw InvalidConfiguration("due date adjustment " +
                                   due_date_adjustment_to_string(config.due_date_adjustment) +
                                   " requires a holiday calendar");
    }

    const int64_t total_minor = total.minor_units();
    int64_t base_minor = round_to_integer(Decimal(total_minor) / n, config.rounding_mode);

    // Rounding up can overshoot for tiny totals spread over many installments
    if (base_minor * (n - 1) > total_minor) {
        base_minor = total_minor / n;
    }

    const Money base = Money::from_minor(base_minor);
    const Money last = total - base * (n - 1);

    std::vector<Installment> installments;
    installments.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        const Date due = adjust_due_date(periodicity.due_date(first_due, i), config, calendar);
        installments.emplace_back(InstallmentId(static_cast<uint32_t>(i + 1)),
                                  i == n - 1 ? last : base,
                                  due);
    }
    return installments;
}

AmortizationPlan create_plan(
    Money total,
    int n,
    const Date& first_due,
    const Periodicity& periodicity,
    const EngineConfig& config,
    const HolidayCalendar* calendar
) {
    return AmortizationPlan(total, first_due, periodicity,
                            split(total, n, first_due, periodicity, config, calendar));
}

std::vector<Money> allocate(Money total, const std::vector<Decimal>& weights, RoundingMode mode) {
    if (total.is_negative()) {
        throw NegativeAmount("total " + total.to_string() + " cannot be allocated");
    }
    if (weights.empty()) {
        throw InvalidAllocation("no weights given");
    }

    Decimal weight_sum = 0;
    for (const auto& weight : weights) {
        if (weight < 0) {
            throw NegativeAmount("allocation weight " + weight.str() + " is negative");
        }
        weight_sum += weight;
    }
    if (weight_sum != 1) {
        throw InvalidAllocation("weights sum to " + weight_sum.str() + ", expected 1");
    }

    std::vector<Money> shares;
    shares.reserve(weights.size());
    Money assigned;
    for (size_t i = 0; i + 1 < weights.size(); ++i) {
        const Money share = Money::from_decimal(total.to_decimal() * weights[i], mode);
        shares.push_back(share);
        assigned += share;
    }

    const Money remainder = total - assigned;
    if (remainder.is_negative()) {
        throw InvalidAllocation("rounded shares exceed total " + total.to_string() +
                                " by " + (-remainder).to_string());
    }
    shares.push_back(remainder);
    return shares;
}

} // namespace ledgercalc
